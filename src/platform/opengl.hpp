#ifndef GLMIRROR_PLATFORM_OPENGL_HPP_INCLUDED
#define GLMIRROR_PLATFORM_OPENGL_HPP_INCLUDED

#include "utils/contracts.hpp"
#include <GL/gl.h>
#include <GL/glext.h>

namespace gm
{
struct OpenGL
{
    GLenum (*glGetError)(void);
    const GLubyte* (*glGetString)(GLenum name);
    void (*glGenBuffers)(GLsizei n, GLuint* buffers);
    void (*glDeleteBuffers)(GLsizei n, const GLuint* buffers);
    void (*glBindBuffer)(GLenum target, GLuint buffer);
    GLboolean (*glIsBuffer)(GLuint buffer);
    void (*glBufferData)(GLenum target,
                         GLsizeiptr size,
                         const void* data,
                         GLenum usage);
    void (*glBufferSubData)(GLenum target,
                            GLintptr offset,
                            GLsizeiptr size,
                            const void* data);
    void (*glGetBufferParameteriv)(GLenum target, GLenum value, GLint* data);
    void* (*glMapBufferRange)(GLenum target,
                              GLintptr offset,
                              GLsizeiptr length,
                              GLbitfield access);
    GLboolean (*glUnmapBuffer)(GLenum target);
    void (*glCopyBufferSubData)(GLenum read_target,
                                GLenum write_target,
                                GLintptr read_offset,
                                GLintptr write_offset,
                                GLsizeiptr size);
};

auto gl() -> OpenGL const&;

} // namespace gm
#endif // GLMIRROR_PLATFORM_OPENGL_HPP_INCLUDED
