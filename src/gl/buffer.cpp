#include "gl/buffer.hpp"
#include "gl/error.hpp"
#include "logging.hpp"
#include <string>

namespace gm::opengl
{
auto BufferTraits::create() const -> GLuint
{
    GLuint name;
    gl().glGenBuffers(1, &name);
    GM_CHECK_GL_ERROR("glGenBuffers");
    return name;
}

auto BufferTraits::destroy(GLuint name) const noexcept -> void
{
    gl().glDeleteBuffers(1, &name);
    GM_CHECK_GL_ERROR_NOEXCEPT("glDeleteBuffers");
}

auto BufferTraits::bind(GLenum target, GLuint name) const -> void
{
    gl().glBindBuffer(target, name);
    GM_CHECK_GL_ERROR("glBindBuffer");
}

auto BufferTraits::unbind(GLenum target) const noexcept -> void
{
    gl().glBindBuffer(target, 0);
    GM_CHECK_GL_ERROR_NOEXCEPT("glBindBuffer");
}

auto to_gl(MapAccess access) noexcept -> GLbitfield
{
    switch (access) {
    case MapAccess::read_only:
        return GL_MAP_READ_BIT;
    case MapAccess::write_only:
        return GL_MAP_WRITE_BIT;
    case MapAccess::read_write:
    default:
        return GL_MAP_READ_BIT | GL_MAP_WRITE_BIT;
    }
}

auto to_string(BufferTarget target) noexcept -> char const*
{
#define GM_BUFFER_TARGET_STR(val, str)                                         \
    case BufferTarget::val:                                                    \
        return str

    switch (target) {
        GM_BUFFER_TARGET_STR(array_buffer, "ArrayBuffer");
        GM_BUFFER_TARGET_STR(atomic_counter_buffer, "AtomicCounterBuffer");
        GM_BUFFER_TARGET_STR(copy_read_buffer, "CopyReadBuffer");
        GM_BUFFER_TARGET_STR(copy_write_buffer, "CopyWriteBuffer");
        GM_BUFFER_TARGET_STR(dispatch_indirect_buffer,
                             "DispatchIndirectBuffer");
        GM_BUFFER_TARGET_STR(draw_indirect_buffer, "DrawIndirectBuffer");
        GM_BUFFER_TARGET_STR(element_array_buffer, "ElementArrayBuffer");
        GM_BUFFER_TARGET_STR(pixel_pack_buffer, "PixelPackBuffer");
        GM_BUFFER_TARGET_STR(pixel_unpack_buffer, "PixelUnpackBuffer");
        GM_BUFFER_TARGET_STR(query_buffer, "QueryBuffer");
        GM_BUFFER_TARGET_STR(shader_storage_buffer, "ShaderStorageBuffer");
        GM_BUFFER_TARGET_STR(texture_buffer, "TextureBuffer");
        GM_BUFFER_TARGET_STR(transform_feedback_buffer,
                             "TransformFeedbackBuffer");
        GM_BUFFER_TARGET_STR(uniform_buffer, "UniformBuffer");
    default:
        return "Unknown";
    }

#undef GM_BUFFER_TARGET_STR
}

auto to_string(BufferUsage usage) noexcept -> char const*
{
    switch (usage) {
    case BufferUsage::stream_draw:
        return "StreamDraw";
    case BufferUsage::stream_read:
        return "StreamRead";
    case BufferUsage::stream_copy:
        return "StreamCopy";
    case BufferUsage::static_draw:
        return "StaticDraw";
    case BufferUsage::static_read:
        return "StaticRead";
    case BufferUsage::static_copy:
        return "StaticCopy";
    case BufferUsage::dynamic_draw:
        return "DynamicDraw";
    case BufferUsage::dynamic_read:
        return "DynamicRead";
    case BufferUsage::dynamic_copy:
        return "DynamicCopy";
    default:
        return "Unknown";
    }
}

auto usage_from_gl(GLenum value) noexcept -> std::optional<BufferUsage>
{
    switch (value) {
    case GL_STREAM_DRAW:
    case GL_STREAM_READ:
    case GL_STREAM_COPY:
    case GL_STATIC_DRAW:
    case GL_STATIC_READ:
    case GL_STATIC_COPY:
    case GL_DYNAMIC_DRAW:
    case GL_DYNAMIC_READ:
    case GL_DYNAMIC_COPY:
        return static_cast<BufferUsage>(value);
    default:
        return std::nullopt;
    }
}

auto bind(BufferTarget target, Buffer const& buffer) -> BufferBinding
{
    return BufferBinding { to_gl(target), buffer.name() };
}

auto buffer_data(BufferBinding const& binding,
                 std::size_t size,
                 void const* data,
                 BufferUsage usage) -> void
{
    gl().glBufferData(
        binding.target(), static_cast<GLsizeiptr>(size), data, to_gl(usage));
    GM_CHECK_GL_ERROR("glBufferData");
}

auto buffer_sub_data(BufferBinding const& binding,
                     std::size_t offset,
                     std::span<std::byte const> data) -> void
{
    if (data.empty())
        return;

    gl().glBufferSubData(binding.target(),
                         static_cast<GLintptr>(offset),
                         static_cast<GLsizeiptr>(data.size()),
                         data.data());
    GM_CHECK_GL_ERROR("glBufferSubData");
}

auto get_buffer_parameter(BufferBinding const& binding, GLenum param_name)
    -> GLint
{
    GLint value = 0;
    gl().glGetBufferParameteriv(binding.target(), param_name, &value);
    GM_CHECK_GL_ERROR("glGetBufferParameteriv");
    return value;
}

auto copy_buffer_sub_data(BufferBinding const& read_binding,
                          BufferBinding const& write_binding,
                          std::size_t read_offset,
                          std::size_t write_offset,
                          std::size_t size) -> void
{
    if (size == 0)
        return;

    gl().glCopyBufferSubData(read_binding.target(),
                             write_binding.target(),
                             static_cast<GLintptr>(read_offset),
                             static_cast<GLintptr>(write_offset),
                             static_cast<GLsizeiptr>(size));
    GM_CHECK_GL_ERROR("glCopyBufferSubData");
}

BufferMapping::BufferMapping(Buffer const& buffer,
                             BufferTarget target,
                             std::size_t offset,
                             std::size_t length,
                             MapAccess access)
    : binding_ { to_gl(target), buffer.name() }
    , access_ { access }
{
    if (length == 0)
        return;

    auto* address = gl().glMapBufferRange(to_gl(target),
                                          static_cast<GLintptr>(offset),
                                          static_cast<GLsizeiptr>(length),
                                          to_gl(access));
    GM_CHECK_GL_ERROR("glMapBufferRange");
    if (!address)
        throw_gl_error("glMapBufferRange returned a null address");

    bytes_ = std::span<std::byte> { static_cast<std::byte*>(address), length };
}

auto BufferMapping::unmap() -> void
{
    if (bytes_.empty())
        return;

    bytes_ = {};
    auto const result = gl().glUnmapBuffer(binding_.target());
    GM_CHECK_GL_ERROR("glUnmapBuffer");
    if (result != GL_TRUE) {
        throw_gl_error("glUnmapBuffer: data store of buffer " +
                       std::to_string(binding_.name()) +
                       " was corrupted while mapped");
    }
}

BufferMapping::~BufferMapping()
{
    if (bytes_.empty())
        return;

    if (gl().glUnmapBuffer(binding_.target()) != GL_TRUE) {
        log(LogLevel::error,
            "glUnmapBuffer: data store of buffer %u was corrupted while "
            "mapped",
            binding_.name());
    }
    GM_CHECK_GL_ERROR_NOEXCEPT("glUnmapBuffer");
}

} // namespace gm::opengl
