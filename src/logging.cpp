#include "logging.hpp"
#include "config.hpp"
#include <cstdlib>

namespace gm
{
namespace detail
{
/* An unusable level falls back to `info`; `read_config()` reports it.
 */
auto min_log_level() noexcept -> std::uint8_t
{
    static std::uint8_t const level = [] {
        auto const* env_var = std::getenv(kLogLevelEnvVar);
        auto const parsed = parse_log_level(env_var ? env_var : "");
        return static_cast<std::uint8_t>(parsed.value_or(LogLevel::info));
    }();

    return level;
}
} // namespace detail

auto to_string(LogLevel level) noexcept -> char const*
{
    switch (level) {
    case LogLevel::debug:
        return "debug";
    case LogLevel::info:
        return "info";
    case LogLevel::warn:
        return "warn";
    case LogLevel::error:
    default:
        return "error";
    }
}

} // namespace gm
