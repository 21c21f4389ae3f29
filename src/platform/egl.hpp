#ifndef GLMIRROR_PLATFORM_EGL_HPP_INCLUDED
#define GLMIRROR_PLATFORM_EGL_HPP_INCLUDED

#include <EGL/egl.h>
#include <EGL/eglext.h>
#include <memory>
#include <type_traits>

namespace gm
{

struct EGL
{
    EGLint (*eglGetError)(void);
    EGLDisplay (*eglGetDisplay)(EGLNativeDisplayType display_id);
    EGLDisplay (*eglGetPlatformDisplay)(EGLenum platform,
                                        void* native_display,
                                        EGLAttrib const* attrib_list);
    EGLBoolean (*eglInitialize)(EGLDisplay dpy, EGLint* major, EGLint* minor);
    EGLBoolean (*eglTerminate)(EGLDisplay dpy);
    EGLBoolean (*eglBindAPI)(EGLenum api);
    EGLBoolean (*eglChooseConfig)(EGLDisplay dpy,
                                  EGLint const* attrib_list,
                                  EGLConfig* configs,
                                  EGLint config_size,
                                  EGLint* num_config);
    EGLContext (*eglCreateContext)(EGLDisplay dpy,
                                   EGLConfig config,
                                   EGLContext share_context,
                                   EGLint const* attrib_list);
    EGLBoolean (*eglDestroyContext)(EGLDisplay dpy, EGLContext ctx);
    EGLSurface (*eglCreatePbufferSurface)(EGLDisplay dpy,
                                          EGLConfig config,
                                          EGLint const* attrib_list);
    EGLBoolean (*eglDestroySurface)(EGLDisplay dpy, EGLSurface surface);
    char const* (*eglQueryString)(EGLDisplay dpy, EGLint name);
    EGLBoolean (*eglMakeCurrent)(EGLDisplay dpy,
                                 EGLSurface draw,
                                 EGLSurface read,
                                 EGLContext ctx);
};

auto egl() -> EGL const&;

struct EGLDisplayDeleter
{
    auto operator()(EGLDisplay ptr) const noexcept -> void;
};

struct EGLSurfaceDeleter
{
    auto operator()(EGLSurface ptr) const noexcept -> void;
    EGLDisplay display;
};

struct EGLContextDeleter
{
    auto operator()(EGLContext ptr) const noexcept -> void;
    EGLDisplay display;
};

using EGLDisplayPtr =
    std::unique_ptr<std::remove_pointer_t<EGLDisplay>, EGLDisplayDeleter>;
using EGLSurfacePtr =
    std::unique_ptr<std::remove_pointer_t<EGLSurface>, EGLSurfaceDeleter>;
using EGLContextPtr =
    std::unique_ptr<std::remove_pointer_t<EGLContext>, EGLContextDeleter>;

/* An offscreen GL context, current on the creating thread for its whole
 * lifetime. Prefers the Mesa surfaceless platform so no display server is
 * needed.
 */
struct HeadlessContext
{
    HeadlessContext(EGLDisplayPtr display,
                    EGLSurfacePtr surface,
                    EGLContextPtr context) noexcept;
    HeadlessContext(HeadlessContext const&) = delete;
    auto operator=(HeadlessContext const&) -> HeadlessContext& = delete;
    ~HeadlessContext();

    EGLDisplayPtr display;
    EGLSurfacePtr surface;
    EGLContextPtr context;
};

[[nodiscard]] auto create_headless_context(int gl_major_version = 3,
                                           int gl_minor_version = 3)
    -> std::unique_ptr<HeadlessContext>;

} // namespace gm

#endif // GLMIRROR_PLATFORM_EGL_HPP_INCLUDED
