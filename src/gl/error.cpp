#include "gl/error.hpp"
#include "../error.hpp"
#include <GL/gl.h>
#include <GL/glext.h>
#include <string>

namespace gm
{
auto gl_error_to_string(GLenum glerror) noexcept -> char const*
{
#define GM_GL_ERROR_STR(val)                                                   \
    case val:                                                                  \
        return "" #val

    switch (glerror) {
        GM_GL_ERROR_STR(GL_NO_ERROR);
        GM_GL_ERROR_STR(GL_INVALID_ENUM);
        GM_GL_ERROR_STR(GL_INVALID_VALUE);
        GM_GL_ERROR_STR(GL_INVALID_OPERATION);
        GM_GL_ERROR_STR(GL_INVALID_FRAMEBUFFER_OPERATION);
        GM_GL_ERROR_STR(GL_OUT_OF_MEMORY);
        GM_GL_ERROR_STR(GL_STACK_UNDERFLOW);
        GM_GL_ERROR_STR(GL_STACK_OVERFLOW);
    default:
        return "GL_UNKNOWN";
    }

#undef GM_GL_ERROR_STR
}

auto throw_gl_error(std::string const& msg, std::source_location loc) -> void
{
    throw DeviceError { msg + " " + loc.file_name() + ":" +
                        std::to_string(loc.line()) };
}

} // namespace gm
