#ifndef GLMIRROR_BUFFER_DEVICE_HANDLE_HPP_INCLUDED
#define GLMIRROR_BUFFER_DEVICE_HANDLE_HPP_INCLUDED

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>

namespace gm
{

enum class MapAccess
{
    read_only,
    write_only,
    read_write,
};

auto to_string(MapAccess access) noexcept -> char const*;

// clang-format off
template<typename T>
concept BufferItem =
        std::is_trivially_copyable_v<T> &&
        std::is_default_constructible_v<T>;

template<typename M>
concept MappedRange = requires (M& mapping) {
    { mapping.bytes() } -> std::convertible_to<std::span<std::byte>>;
    { mapping.unmap() };
};

/* A linear block of device memory owned by exactly one holder.
 *
 * - `map_range(offset, length, access)` maps a byte range for the lifetime
 *   of the returned object. `unmap()` on the mapping releases it and throws
 *   if the device lost the data; destruction releases it otherwise.
 * - `reallocate_copy(new_size, live_size, fill)` replaces the storage with a
 *   block of `new_size` bytes, keeping the first `min(live_size, new_size)`
 *   bytes and repeating `fill` over the remainder.
 * - `clone()` produces an independent block with the same contents.
 */
template<typename H>
concept DeviceHandle =
        std::is_nothrow_move_constructible_v<H> &&
        std::is_nothrow_move_assignable_v<H> &&
        !std::is_copy_constructible_v<H> &&
        requires (H& handle,
                  H const& const_handle,
                  std::size_t n,
                  MapAccess access,
                  std::span<std::byte const> fill) {

    { const_handle.size_in_bytes() } -> std::convertible_to<std::size_t>;
    { const_handle.map_range(n, n, access) } -> MappedRange;
    { handle.reallocate_copy(n, n, fill) };
    { const_handle.clone() } -> std::same_as<H>;
};
// clang-format on

} // namespace gm

#endif // GLMIRROR_BUFFER_DEVICE_HANDLE_HPP_INCLUDED
