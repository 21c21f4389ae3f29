#ifndef GLMIRROR_BUFFER_STATIC_BUFFER_HPP_INCLUDED
#define GLMIRROR_BUFFER_STATIC_BUFFER_HPP_INCLUDED

#include "buffer/device_handle.hpp"
#include "gl/device_buffer.hpp"
#include "utils/contracts.hpp"
#include <cstddef>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

namespace gm
{

/* A typed view over a device buffer. Every access goes to the device; there
 * is no host copy. `len()` counts the populated items, `capacity()` the items
 * the device storage can hold.
 *
 * A device error while mapping or unmapping propagates; a write that throws
 * may have left the range undefined on the device.
 */
template <BufferItem T, DeviceHandle H = opengl::DeviceBuffer>
struct StaticBuffer
{
    using value_type = T;
    using handle_type = H;

    explicit StaticBuffer(H handle) noexcept
        : handle_ { std::move(handle) }
    {
    }

    StaticBuffer(H handle, std::size_t len)
        : handle_ { std::move(handle) }
        , len_ { len }
    {
        GM_EXPECT(len_ <= capacity());
    }

    /* A moved-from view is empty.
     */
    StaticBuffer(StaticBuffer&& other) noexcept
        : handle_ { std::move(other.handle_) }
        , len_ { std::exchange(other.len_, 0) }
    {
    }

    auto operator=(StaticBuffer&& other) noexcept -> StaticBuffer&
    {
        handle_ = std::move(other.handle_);
        len_ = std::exchange(other.len_, 0);
        return *this;
    }

    auto len() const noexcept -> std::size_t { return len_; }
    auto is_empty() const noexcept -> bool { return len_ == 0; }
    auto capacity() const noexcept -> std::size_t
    {
        return handle_.size_in_bytes() / sizeof(T);
    }
    auto size_in_bytes() const noexcept -> std::size_t
    {
        return handle_.size_in_bytes();
    }

    /* Records the populated length without touching the device.
     */
    auto set_len(std::size_t len) -> void
    {
        GM_EXPECT(len <= capacity());
        len_ = len;
    }

    auto get(std::size_t index) const -> T
    {
        GM_EXPECT_INDEX(index, capacity());
        auto mapping = handle_.map_range(
            index * sizeof(T), sizeof(T), MapAccess::read_only);

        T value {};
        std::memcpy(&value, std::span<std::byte> { mapping.bytes() }.data(),
                    sizeof(T));
        mapping.unmap();
        return value;
    }

    auto set(std::size_t index, T const& value) -> void
    {
        GM_EXPECT_INDEX(index, capacity());
        auto mapping = handle_.map_range(
            index * sizeof(T), sizeof(T), MapAccess::write_only);
        std::memcpy(std::span<std::byte> { mapping.bytes() }.data(),
                    &value,
                    sizeof(T));
        mapping.unmap();
    }

    auto get_slice(std::size_t start, std::size_t count) const
        -> std::vector<T>
    {
        std::vector<T> items(count);
        read_slice(start, std::span<T> { items });
        return items;
    }

    auto read_slice(std::size_t start, std::span<T> out) const -> void
    {
        check_span(start, out.size());
        if (out.empty())
            return;

        auto mapping = handle_.map_range(
            start * sizeof(T), out.size_bytes(), MapAccess::read_only);
        std::memcpy(out.data(),
                    std::span<std::byte> { mapping.bytes() }.data(),
                    out.size_bytes());
        mapping.unmap();
    }

    auto set_slice(std::size_t start, std::span<T const> items) -> void
    {
        check_span(start, items.size());
        if (items.empty())
            return;

        auto mapping = handle_.map_range(
            start * sizeof(T), items.size_bytes(), MapAccess::write_only);
        std::memcpy(std::span<std::byte> { mapping.bytes() }.data(),
                    items.data(),
                    items.size_bytes());
        mapping.unmap();
    }

    /* Growing past `capacity()` reallocates the device storage, keeping
     * the populated items. New slots hold `fill` in either case.
     */
    auto resize(std::size_t new_len, T const& fill) -> void
    {
        if (new_len > capacity()) {
            handle_.reallocate_copy(new_len * sizeof(T),
                                    len_ * sizeof(T),
                                    std::as_bytes(std::span { &fill, 1 }));
        }
        else if (new_len > len_) {
            auto mapping = handle_.map_range(len_ * sizeof(T),
                                             (new_len - len_) * sizeof(T),
                                             MapAccess::write_only);
            auto bytes = std::span<std::byte> { mapping.bytes() };
            for (std::size_t offset = 0; offset < bytes.size();
                 offset += sizeof(T))
                std::memcpy(bytes.data() + offset, &fill, sizeof(T));
            mapping.unmap();
        }

        len_ = new_len;
    }

    auto shrink_to_fit() -> void
    {
        if (capacity() == len_)
            return;

        handle_.reallocate_copy(len_ * sizeof(T), len_ * sizeof(T), {});
    }

    auto handle() const noexcept -> H const& { return handle_; }
    auto handle() noexcept -> H& { return handle_; }

    /* Moves the device handle out. The view is left empty.
     */
    [[nodiscard]] auto release() && noexcept -> H
    {
        len_ = 0;
        return std::move(handle_);
    }

    [[nodiscard]] auto clone() const -> StaticBuffer
    {
        return StaticBuffer { handle_.clone(), len_ };
    }

private:
    auto check_span(std::size_t start, std::size_t count) const -> void
    {
        GM_EXPECT(start <= capacity() && count <= capacity() - start);
    }

    H handle_;
    std::size_t len_ { 0 };
};

} // namespace gm

#endif // GLMIRROR_BUFFER_STATIC_BUFFER_HPP_INCLUDED
