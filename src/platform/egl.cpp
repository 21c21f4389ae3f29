#include "platform/egl.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "utils/symbol.hpp"
#include <cstdio>
#include <string>
#include <string_view>

namespace
{
auto load_egl() -> gm::EGL
{
    auto const& library = gm::config().egl_library;
    auto lib = gm::open_module(library);
    gm::log(gm::LogLevel::info, "Loaded EGL module: %s", library.c_str());

    gm::EGL egl {};
    TRY_ATTACH_SYMBOL(&egl.eglGetError, "eglGetError", lib);
    TRY_ATTACH_SYMBOL(&egl.eglGetDisplay, "eglGetDisplay", lib);
    TRY_ATTACH_SYMBOL(&egl.eglGetPlatformDisplay, "eglGetPlatformDisplay", lib);
    TRY_ATTACH_SYMBOL(&egl.eglInitialize, "eglInitialize", lib);
    TRY_ATTACH_SYMBOL(&egl.eglTerminate, "eglTerminate", lib);
    TRY_ATTACH_SYMBOL(&egl.eglBindAPI, "eglBindAPI", lib);
    TRY_ATTACH_SYMBOL(&egl.eglChooseConfig, "eglChooseConfig", lib);
    TRY_ATTACH_SYMBOL(&egl.eglCreateContext, "eglCreateContext", lib);
    TRY_ATTACH_SYMBOL(&egl.eglDestroyContext, "eglDestroyContext", lib);
    TRY_ATTACH_SYMBOL(
        &egl.eglCreatePbufferSurface, "eglCreatePbufferSurface", lib);
    TRY_ATTACH_SYMBOL(&egl.eglDestroySurface, "eglDestroySurface", lib);
    TRY_ATTACH_SYMBOL(&egl.eglQueryString, "eglQueryString", lib);
    TRY_ATTACH_SYMBOL(&egl.eglMakeCurrent, "eglMakeCurrent", lib);

    return egl;
}

auto has_client_extension(gm::EGL const& egl, std::string_view name) -> bool
{
    auto const* extensions = egl.eglQueryString(EGL_NO_DISPLAY, EGL_EXTENSIONS);
    if (!extensions)
        return false;

    std::string_view const all { extensions };
    for (std::size_t pos = all.find(name); pos != std::string_view::npos;
         pos = all.find(name, pos + 1)) {
        auto const end = pos + name.size();
        if ((pos == 0 || all[pos - 1] == ' ') &&
            (end == all.size() || all[end] == ' '))
            return true;
    }

    return false;
}

auto egl_error(char const* what) -> gm::DeviceError
{
    char code[16];
    std::snprintf(code,
                  sizeof(code),
                  "0x%x",
                  static_cast<unsigned>(gm::egl().eglGetError()));
    return gm::DeviceError { std::string { what } + " (EGL error " + code +
                             ")" };
}

} // namespace

namespace gm
{

auto egl() -> EGL const&
{
    static EGL const egl_module = load_egl();
    return egl_module;
}

auto EGLDisplayDeleter::operator()(EGLDisplay ptr) const noexcept -> void
{
    gm::egl().eglTerminate(ptr);
}

auto EGLSurfaceDeleter::operator()(EGLSurface ptr) const noexcept -> void
{
    gm::egl().eglDestroySurface(display, ptr);
}

auto EGLContextDeleter::operator()(EGLContext ptr) const noexcept -> void
{
    gm::egl().eglDestroyContext(display, ptr);
}

HeadlessContext::HeadlessContext(EGLDisplayPtr d,
                                 EGLSurfacePtr s,
                                 EGLContextPtr c) noexcept
    : display { std::move(d) }
    , surface { std::move(s) }
    , context { std::move(c) }
{
}

HeadlessContext::~HeadlessContext()
{
    if (display)
        gm::egl().eglMakeCurrent(
            display.get(), EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
}

auto create_headless_context(int gl_major_version, int gl_minor_version)
    -> std::unique_ptr<HeadlessContext>
{
    // clang-format off
    EGLint const config_attribs[] = {
        EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
        EGL_RENDERABLE_TYPE, EGL_OPENGL_BIT,
        EGL_NONE,
    };

    EGLint const pbuffer_attribs[] = {
        EGL_WIDTH, 1,
        EGL_HEIGHT, 1,
        EGL_NONE,
    };

    EGLint const context_attribs[] = {
        EGL_CONTEXT_MAJOR_VERSION, gl_major_version,
        EGL_CONTEXT_MINOR_VERSION, gl_minor_version,
        EGL_NONE,
    };
    // clang-format on

    auto const& lib = gm::egl();

    EGLDisplay raw_display = EGL_NO_DISPLAY;
    if (has_client_extension(lib, "EGL_MESA_platform_surfaceless")) {
        raw_display = lib.eglGetPlatformDisplay(
            EGL_PLATFORM_SURFACELESS_MESA, EGL_DEFAULT_DISPLAY, nullptr);
    }
    if (raw_display == EGL_NO_DISPLAY)
        raw_display = lib.eglGetDisplay(EGL_DEFAULT_DISPLAY);

    if (raw_display == EGL_NO_DISPLAY)
        throw egl_error("Failed to get EGL display");

    EGLint major = 0;
    EGLint minor = 0;
    if (!lib.eglInitialize(raw_display, &major, &minor))
        throw egl_error("Failed to initialize EGL display");

    EGLDisplayPtr display { raw_display };
    log(LogLevel::debug, "EGL version %d.%d", major, minor);

    if (!lib.eglBindAPI(EGL_OPENGL_API))
        throw egl_error("Failed to bind EGL API");

    EGLConfig egl_config;
    EGLint num_egl_config = 0;
    if (!lib.eglChooseConfig(
            display.get(), config_attribs, &egl_config, 1, &num_egl_config) ||
        num_egl_config < 1) {
        throw egl_error("Failed to select EGL config");
    }

    EGLSurfacePtr surface { lib.eglCreatePbufferSurface(
                                  display.get(), egl_config, pbuffer_attribs),
                              { display.get() } };
    if (surface.get() == EGL_NO_SURFACE)
        throw egl_error("Failed to create EGL pbuffer surface");

    EGLContextPtr context {
        lib.eglCreateContext(
            display.get(), egl_config, EGL_NO_CONTEXT, context_attribs),
        { display.get() }
    };
    if (context.get() == EGL_NO_CONTEXT)
        throw egl_error("Failed to create EGL context");

    if (!lib.eglMakeCurrent(
            display.get(), surface.get(), surface.get(), context.get()))
        throw egl_error("Failed to make EGL context current");

    return std::make_unique<HeadlessContext>(
        std::move(display), std::move(surface), std::move(context));
}

} // namespace gm
