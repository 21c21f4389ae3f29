#include "platform/opengl.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "utils/symbol.hpp"

namespace gm
{
namespace
{
auto load_opengl() -> OpenGL
{
    auto const& library = config().gl_library;
    auto lib = open_module(library);
    log(LogLevel::info, "Loaded OpenGL module: %s", library.c_str());

    OpenGL opengl {};
    TRY_ATTACH_SYMBOL(&opengl.glGetError, "glGetError", lib);
    TRY_ATTACH_SYMBOL(&opengl.glGetString, "glGetString", lib);
    TRY_ATTACH_SYMBOL(&opengl.glGenBuffers, "glGenBuffers", lib);
    TRY_ATTACH_SYMBOL(&opengl.glDeleteBuffers, "glDeleteBuffers", lib);
    TRY_ATTACH_SYMBOL(&opengl.glBindBuffer, "glBindBuffer", lib);
    TRY_ATTACH_SYMBOL(&opengl.glIsBuffer, "glIsBuffer", lib);
    TRY_ATTACH_SYMBOL(&opengl.glBufferData, "glBufferData", lib);
    TRY_ATTACH_SYMBOL(&opengl.glBufferSubData, "glBufferSubData", lib);
    TRY_ATTACH_SYMBOL(
        &opengl.glGetBufferParameteriv, "glGetBufferParameteriv", lib);
    TRY_ATTACH_SYMBOL(&opengl.glMapBufferRange, "glMapBufferRange", lib);
    TRY_ATTACH_SYMBOL(&opengl.glUnmapBuffer, "glUnmapBuffer", lib);
    TRY_ATTACH_SYMBOL(&opengl.glCopyBufferSubData, "glCopyBufferSubData", lib);

    return opengl;
}
} // namespace

auto gl() -> OpenGL const&
{
    static OpenGL const opengl = load_opengl();
    return opengl;
}
} // namespace gm
