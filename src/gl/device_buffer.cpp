#include "gl/device_buffer.hpp"
#include "../error.hpp"
#include "logging.hpp"
#include "utils/contracts.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace
{
/* Repeats `pattern` over `size` bytes. An empty pattern yields zeroes.
 */
auto tile(std::span<std::byte const> pattern, std::size_t size)
    -> std::vector<std::byte>
{
    std::vector<std::byte> bytes(size);
    if (pattern.empty())
        return bytes;

    for (std::size_t i = 0; i < size; ++i)
        bytes[i] = pattern[i % pattern.size()];

    return bytes;
}

} // namespace

namespace gm::opengl
{
DeviceBuffer::DeviceBuffer(Buffer buffer,
                           BufferTarget target,
                           BufferUsage usage,
                           std::size_t size) noexcept
    : buffer_ { std::move(buffer) }
    , target_ { target }
    , usage_ { usage }
    , size_ { size }
{
}

auto DeviceBuffer::allocate(BufferTarget target,
                            std::size_t size,
                            BufferUsage usage,
                            std::span<std::byte const> initial_data)
    -> DeviceBuffer
{
    GM_EXPECT(initial_data.empty() || initial_data.size() == size);

    auto buffer = create<Buffer>();
    {
        auto binding = opengl::bind(target, buffer);
        buffer_data(binding,
                    size,
                    initial_data.empty() ? nullptr : initial_data.data(),
                    usage);
    }

    log(LogLevel::debug,
        "Allocated buffer %u: %zu bytes, %s, %s",
        buffer.name(),
        size,
        to_string(target),
        to_string(usage));

    return DeviceBuffer { std::move(buffer), target, usage, size };
}

auto DeviceBuffer::from_raw(GLuint name, BufferTarget target) -> DeviceBuffer
{
    GM_EXPECT(name != Buffer::no_name);

    GLint size = 0;
    GLint usage_value = 0;
    {
        BufferBinding binding { to_gl(target), name };
        size = get_buffer_parameter(binding, GL_BUFFER_SIZE);
        usage_value = get_buffer_parameter(binding, GL_BUFFER_USAGE);
    }

    auto const usage = usage_from_gl(static_cast<GLenum>(usage_value));
    if (!usage) {
        throw DeviceError { "Unknown usage for buffer " + std::to_string(name) +
                            ": " + std::to_string(usage_value) };
    }

    return DeviceBuffer {
        Buffer { name }, target, *usage, static_cast<std::size_t>(size)
    };
}

auto DeviceBuffer::release() noexcept -> GLuint
{
    size_ = 0;
    return buffer_.release();
}

auto DeviceBuffer::clone() const -> DeviceBuffer
{
    auto copy = create<Buffer>();
    {
        auto write_binding =
            opengl::bind(BufferTarget::copy_write_buffer, copy);
        buffer_data(write_binding, size_, nullptr, usage_);

        auto read_binding = opengl::bind(BufferTarget::copy_read_buffer, buffer_);
        copy_buffer_sub_data(read_binding, write_binding, 0, 0, size_);
    }

    log(LogLevel::debug,
        "Cloned buffer %u into %u: %zu bytes",
        buffer_.name(),
        copy.name(),
        size_);

    return DeviceBuffer { std::move(copy), target_, usage_, size_ };
}

auto DeviceBuffer::reallocate_copy(std::size_t new_size,
                                   std::size_t live_size,
                                   std::span<std::byte const> fill_pattern)
    -> void
{
    GM_EXPECT(live_size <= size_);

    auto const keep = std::min(live_size, new_size);
    auto replacement = create<Buffer>();
    {
        auto write_binding =
            opengl::bind(BufferTarget::copy_write_buffer, replacement);
        buffer_data(write_binding, new_size, nullptr, usage_);

        if (new_size > keep) {
            auto const tail = tile(fill_pattern, new_size - keep);
            buffer_sub_data(write_binding, keep, tail);
        }

        if (keep > 0) {
            auto read_binding =
                opengl::bind(BufferTarget::copy_read_buffer, buffer_);
            copy_buffer_sub_data(read_binding, write_binding, 0, 0, keep);
        }
    }

    log(LogLevel::debug,
        "Reallocated buffer %u -> %u: %zu -> %zu bytes, %zu kept",
        buffer_.name(),
        replacement.name(),
        size_,
        new_size,
        keep);

    /* The old buffer is deleted when `replacement` goes out of scope.
     */
    using std::swap;
    swap(buffer_, replacement);
    size_ = new_size;
}

auto DeviceBuffer::map_range(std::size_t offset,
                             std::size_t length,
                             MapAccess access) const -> BufferMapping
{
    GM_EXPECT(offset <= size_ && length <= size_ - offset);
    return BufferMapping { buffer_, target_, offset, length, access };
}

auto DeviceBuffer::bind() const -> BufferBinding
{
    return opengl::bind(target_, buffer_);
}

auto DeviceBuffer::bind_to(BufferTarget target) const -> BufferBinding
{
    return opengl::bind(target, buffer_);
}

} // namespace gm::opengl
