#ifndef GLMIRROR_CONFIG_HPP_INCLUDED
#define GLMIRROR_CONFIG_HPP_INCLUDED

#include "logging.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace gm
{

constexpr char const kLogLevelEnvVar[] = "GLMIRROR_LOG_LEVEL";
constexpr char const kGLLibraryEnvVar[] = "GLMIRROR_GL_LIBRARY";
constexpr char const kEGLLibraryEnvVar[] = "GLMIRROR_EGL_LIBRARY";

struct Config
{
    LogLevel log_level { LogLevel::info };
    std::string gl_library { "libGL.so.1" };
    std::string egl_library { "libEGL.so.1" };
};

/* Accepts "debug", "info", "warn" (or "warning") and "error"...
 */
[[nodiscard]] auto parse_log_level(std::string_view value) noexcept
    -> std::optional<LogLevel>;

/* Reads the environment. Throws `ConfigError` if a variable is set to a
 * value that can't be used.
 */
[[nodiscard]] auto read_config() -> Config;

/* The process wide configuration, read once on first use.
 */
auto config() -> Config const&;

} // namespace gm

#endif // GLMIRROR_CONFIG_HPP_INCLUDED
