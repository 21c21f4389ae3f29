#ifndef GLMIRROR_GL_ERROR_HPP_INCLUDED
#define GLMIRROR_GL_ERROR_HPP_INCLUDED

#include "platform/opengl.hpp"
#include "utils/contracts.hpp"
#include <GL/gl.h>
#include <source_location>
#include <string>

#define GM_CHECK_GL_ERROR(src)                                                 \
    if (auto const glerror = ::gm::gl().glGetError(); glerror != GL_NO_ERROR)  \
    ::gm::throw_gl_error(::std::string { src " failed: " } +                   \
                         ::gm::gl_error_to_string(glerror))

#define GM_CHECK_GL_ERROR_NOEXCEPT(src)                                        \
    if (auto const glerror = ::gm::gl().glGetError(); glerror != GL_NO_ERROR)  \
    ::gm::contract_check_failed(src)

namespace gm
{
/* Throws `DeviceError` with the message and the caller's location.
 */
[[noreturn]] auto
throw_gl_error(std::string const& msg,
               std::source_location = std::source_location::current()) -> void;
auto gl_error_to_string(GLenum) noexcept -> char const*;
} // namespace gm

#endif // GLMIRROR_GL_ERROR_HPP_INCLUDED
