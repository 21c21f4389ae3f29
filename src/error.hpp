#ifndef GLMIRROR_ERROR_HPP_INCLUDED
#define GLMIRROR_ERROR_HPP_INCLUDED

#include <stdexcept>
#include <string>

namespace gm
{
struct ModuleError final : std::runtime_error
{
    ModuleError(std::string const&);
};

/* Raised by anything that talks to the GL driver: allocation, mapping,
 * copying or querying a buffer.
 */
struct DeviceError final : std::runtime_error
{
    DeviceError(std::string const& msg);
};

struct ConfigError final : std::runtime_error
{
    ConfigError(std::string const& msg);
};

} // namespace gm

#endif // GLMIRROR_ERROR_HPP_INCLUDED
