#include "utils/contracts.hpp"
#include "logging.hpp"
#include <exception>

namespace gm
{
auto contract_check_failed(char const* msg, std::source_location loc) -> void
{
    log(LogLevel::error,
        "Contract check failed: %s - %s:%u",
        msg,
        loc.file_name(),
        static_cast<unsigned>(loc.line()));
    std::terminate();
}

auto index_check_failed(std::size_t index,
                        std::size_t bound,
                        std::source_location loc) -> void
{
    log(LogLevel::error,
        "Index out of range: %zu >= %zu - %s:%u",
        index,
        bound,
        loc.file_name(),
        static_cast<unsigned>(loc.line()));
    std::terminate();
}
} // namespace gm
