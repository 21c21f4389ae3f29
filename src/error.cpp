#include "./error.hpp"

namespace gm
{
ModuleError::ModuleError(std::string const& msg)
    : std::runtime_error { msg }
{
}

DeviceError::DeviceError(std::string const& msg)
    : std::runtime_error { msg }
{
}

ConfigError::ConfigError(std::string const& msg)
    : std::runtime_error { msg }
{
}

} // namespace gm
