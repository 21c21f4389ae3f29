#include "config.hpp"
#include "error.hpp"
#include <cstdlib>

namespace
{
auto read_env_string(char const* name, std::string& value) -> void
{
    if (auto const* env_var = std::getenv(name); env_var && *env_var)
        value = env_var;
}
} // namespace

namespace gm
{

auto parse_log_level(std::string_view value) noexcept
    -> std::optional<LogLevel>
{
    if (value == "debug")
        return LogLevel::debug;
    if (value == "info")
        return LogLevel::info;
    if (value == "warn" || value == "warning")
        return LogLevel::warn;
    if (value == "error")
        return LogLevel::error;

    return std::nullopt;
}

auto read_config() -> Config
{
    Config cfg {};

    if (auto const* log_level = std::getenv(kLogLevelEnvVar); log_level) {
        auto const parsed = parse_log_level(log_level);
        if (!parsed)
            throw ConfigError { std::string { kLogLevelEnvVar } +
                                ": invalid log level '" + log_level + "'" };
        cfg.log_level = *parsed;
    }

    read_env_string(kGLLibraryEnvVar, cfg.gl_library);
    read_env_string(kEGLLibraryEnvVar, cfg.egl_library);

    return cfg;
}

auto config() -> Config const&
{
    static Config const cfg = read_config();
    return cfg;
}

} // namespace gm
