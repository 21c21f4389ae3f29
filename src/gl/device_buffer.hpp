#ifndef GLMIRROR_GL_DEVICE_BUFFER_HPP_INCLUDED
#define GLMIRROR_GL_DEVICE_BUFFER_HPP_INCLUDED

#include "buffer/device_handle.hpp"
#include "gl/buffer.hpp"
#include <GL/gl.h>
#include <cstddef>
#include <span>
#include <utility>

namespace gm
{
namespace opengl
{

/* Owns one GL buffer object along with the byte size, usage hint and default
 * binding target it was created with.
 */
struct DeviceBuffer
{
    /* Creates a buffer of `size` bytes. `initial_data` is either empty, in
     * which case the contents are undefined, or exactly `size` bytes long.
     */
    [[nodiscard]] static auto
    allocate(BufferTarget target,
             std::size_t size,
             BufferUsage usage,
             std::span<std::byte const> initial_data = {}) -> DeviceBuffer;

    /* Takes ownership of an existing buffer name, querying its size and
     * usage. If the query fails the caller keeps ownership of `name`.
     */
    [[nodiscard]] static auto from_raw(GLuint name, BufferTarget target)
        -> DeviceBuffer;

    /* The moved-from buffer has no name and a size of zero.
     */
    DeviceBuffer(DeviceBuffer&& other) noexcept
        : buffer_ { std::move(other.buffer_) }
        , target_ { other.target_ }
        , usage_ { other.usage_ }
        , size_ { std::exchange(other.size_, 0) }
    {
    }

    auto operator=(DeviceBuffer&& other) noexcept -> DeviceBuffer&
    {
        buffer_ = std::move(other.buffer_);
        target_ = other.target_;
        usage_ = other.usage_;
        size_ = std::exchange(other.size_, 0);
        return *this;
    }

    /* Gives up the buffer name without deleting the GL object.
     */
    [[nodiscard]] auto release() noexcept -> GLuint;

    [[nodiscard]] auto clone() const -> DeviceBuffer;

    auto reallocate_copy(std::size_t new_size,
                         std::size_t live_size,
                         std::span<std::byte const> fill_pattern) -> void;

    [[nodiscard]] auto map_range(std::size_t offset,
                                 std::size_t length,
                                 MapAccess access) const -> BufferMapping;

    auto size_in_bytes() const noexcept -> std::size_t { return size_; }
    auto name() const noexcept -> GLuint { return buffer_.name(); }
    auto usage() const noexcept -> BufferUsage { return usage_; }
    auto target() const noexcept -> BufferTarget { return target_; }
    auto set_target(BufferTarget target) noexcept -> void { target_ = target; }

    /* Binds to the default target. Binding to another target with
     * `bind_to()` doesn't change the default.
     */
    [[nodiscard]] auto bind() const -> BufferBinding;
    [[nodiscard]] auto bind_to(BufferTarget target) const -> BufferBinding;

private:
    DeviceBuffer(Buffer buffer,
                 BufferTarget target,
                 BufferUsage usage,
                 std::size_t size) noexcept;

    Buffer buffer_;
    BufferTarget target_;
    BufferUsage usage_;
    std::size_t size_;
};

static_assert(DeviceHandle<DeviceBuffer>);

} // namespace opengl
} // namespace gm

#endif // GLMIRROR_GL_DEVICE_BUFFER_HPP_INCLUDED
