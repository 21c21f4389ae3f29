#ifndef GLMIRROR_GL_BUFFER_HPP_INCLUDED
#define GLMIRROR_GL_BUFFER_HPP_INCLUDED

#include "buffer/device_handle.hpp"
#include "gl/error.hpp"
#include "gl/object.hpp"
#include "platform/opengl.hpp"
#include <GL/gl.h>
#include <GL/glext.h>
#include <cstddef>
#include <optional>
#include <span>

namespace gm
{

namespace opengl
{
struct BufferCategory
{
};

struct BufferTraits
{
    using category = BufferCategory;

    auto create() const -> GLuint;
    auto destroy(GLuint name) const noexcept -> void;
    auto bind(GLenum target, GLuint name) const -> void;
    auto unbind(GLenum target) const noexcept -> void;
};

using Buffer = ObjectBase<BufferTraits>;
using BufferBinding = Binding<BufferTraits>;

enum class BufferTarget : GLenum
{
    array_buffer = GL_ARRAY_BUFFER,
    atomic_counter_buffer = GL_ATOMIC_COUNTER_BUFFER,
    copy_read_buffer = GL_COPY_READ_BUFFER,
    copy_write_buffer = GL_COPY_WRITE_BUFFER,
    dispatch_indirect_buffer = GL_DISPATCH_INDIRECT_BUFFER,
    draw_indirect_buffer = GL_DRAW_INDIRECT_BUFFER,
    element_array_buffer = GL_ELEMENT_ARRAY_BUFFER,
    pixel_pack_buffer = GL_PIXEL_PACK_BUFFER,
    pixel_unpack_buffer = GL_PIXEL_UNPACK_BUFFER,
    query_buffer = GL_QUERY_BUFFER,
    shader_storage_buffer = GL_SHADER_STORAGE_BUFFER,
    texture_buffer = GL_TEXTURE_BUFFER,
    transform_feedback_buffer = GL_TRANSFORM_FEEDBACK_BUFFER,
    uniform_buffer = GL_UNIFORM_BUFFER,
};

enum class BufferUsage : GLenum
{
    stream_draw = GL_STREAM_DRAW,
    stream_read = GL_STREAM_READ,
    stream_copy = GL_STREAM_COPY,
    static_draw = GL_STATIC_DRAW,
    static_read = GL_STATIC_READ,
    static_copy = GL_STATIC_COPY,
    dynamic_draw = GL_DYNAMIC_DRAW,
    dynamic_read = GL_DYNAMIC_READ,
    dynamic_copy = GL_DYNAMIC_COPY,
};

constexpr auto to_gl(BufferTarget target) noexcept -> GLenum
{
    return static_cast<GLenum>(target);
}

constexpr auto to_gl(BufferUsage usage) noexcept -> GLenum
{
    return static_cast<GLenum>(usage);
}

auto to_gl(MapAccess access) noexcept -> GLbitfield;

auto to_string(BufferTarget target) noexcept -> char const*;
auto to_string(BufferUsage usage) noexcept -> char const*;

/* Returns `std::nullopt` if `value` isn't one of the nine usage hints.
 */
auto usage_from_gl(GLenum value) noexcept -> std::optional<BufferUsage>;

[[nodiscard]] auto bind(BufferTarget target, Buffer const& buffer)
    -> BufferBinding;

auto buffer_data(BufferBinding const& binding,
                 std::size_t size,
                 void const* data,
                 BufferUsage usage) -> void;

auto buffer_sub_data(BufferBinding const& binding,
                     std::size_t offset,
                     std::span<std::byte const> data) -> void;

auto get_buffer_parameter(BufferBinding const& binding, GLenum param_name)
    -> GLint;

auto copy_buffer_sub_data(BufferBinding const& read_binding,
                          BufferBinding const& write_binding,
                          std::size_t read_offset,
                          std::size_t write_offset,
                          std::size_t size) -> void;

/* Maps a byte range of a buffer for the lifetime of the object. The buffer
 * stays bound to `target` while mapped; both the mapping and the binding are
 * released on every exit path. A zero-length range maps nothing.
 *
 * Call `unmap()` once the range has been accessed; it throws `DeviceError`
 * if the driver reports the data store as corrupted. The destructor only
 * unmaps ranges that `unmap()` wasn't reached for, and logs a failure.
 */
struct BufferMapping
{
    BufferMapping(Buffer const& buffer,
                  BufferTarget target,
                  std::size_t offset,
                  std::size_t length,
                  MapAccess access);

    BufferMapping(BufferMapping const&) = delete;
    auto operator=(BufferMapping const&) -> BufferMapping& = delete;
    BufferMapping(BufferMapping&&) = delete;
    auto operator=(BufferMapping&&) -> BufferMapping& = delete;

    ~BufferMapping();

    auto unmap() -> void;

    auto bytes() const noexcept -> std::span<std::byte> { return bytes_; }
    auto access() const noexcept -> MapAccess { return access_; }
    auto target() const noexcept -> BufferTarget
    {
        return static_cast<BufferTarget>(binding_.target());
    }

private:
    BufferBinding binding_;
    MapAccess access_;
    std::span<std::byte> bytes_ {};
};

} // namespace opengl

} // namespace gm

#endif // GLMIRROR_GL_BUFFER_HPP_INCLUDED
