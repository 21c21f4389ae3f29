#ifndef GLMIRROR_BUFFER_DYNAMIC_BUFFER_HPP_INCLUDED
#define GLMIRROR_BUFFER_DYNAMIC_BUFFER_HPP_INCLUDED

#include "buffer/device_handle.hpp"
#include "buffer/range.hpp"
#include "buffer/static_buffer.hpp"
#include "gl/device_buffer.hpp"
#include "logging.hpp"
#include "utils/contracts.hpp"
#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace gm
{

/* Up to this many clean items between two dirty ones are written along with
 * them rather than starting a new device write.
 */
constexpr std::size_t kMaximumFlushGap = 16;

/* A device buffer with a host copy of its whole storage. Reads are served
 * from the host copy. Writes go to the host copy and mark the item dirty;
 * `flush()` sends the dirty items to the device, merging runs that are at
 * most `kMaximumFlushGap` clean items apart into one write.
 *
 * Converting back with `into_static()` or `into_handle()` flushes. Plain
 * destruction doesn't; pending writes are dropped.
 */
template <BufferItem T, DeviceHandle H = opengl::DeviceBuffer>
struct DynamicBuffer
{
    using value_type = T;
    using handle_type = H;
    using view_type = StaticBuffer<T, H>;

    /* Reads the whole device storage into the host copy.
     */
    explicit DynamicBuffer(view_type view)
        : view_ { std::move(view) }
        , mirror_(view_.capacity())
        , dirty_(view_.capacity(), false)
    {
        view_.read_slice(0, std::span<T> { mirror_ });
    }

    /* Every item the handle can hold is treated as populated.
     */
    explicit DynamicBuffer(H handle)
        : DynamicBuffer { full_view(std::move(handle)) }
    {
    }

    /* A moved-from buffer is empty and clean.
     */
    DynamicBuffer(DynamicBuffer&& other) noexcept
        : view_ { std::move(other.view_) }
        , mirror_ { std::exchange(other.mirror_, {}) }
        , dirty_ { std::exchange(other.dirty_, {}) }
        , dirty_flag_ { std::exchange(other.dirty_flag_, false) }
    {
    }

    auto operator=(DynamicBuffer&& other) noexcept -> DynamicBuffer&
    {
        discard_pending();
        view_ = std::move(other.view_);
        mirror_ = std::exchange(other.mirror_, {});
        dirty_ = std::exchange(other.dirty_, {});
        dirty_flag_ = std::exchange(other.dirty_flag_, false);
        return *this;
    }

    DynamicBuffer(DynamicBuffer const&) = delete;
    auto operator=(DynamicBuffer const&) -> DynamicBuffer& = delete;

    ~DynamicBuffer() { discard_pending(); }

    auto len() const noexcept -> std::size_t { return view_.len(); }
    auto is_empty() const noexcept -> bool { return view_.is_empty(); }
    auto capacity() const noexcept -> std::size_t { return mirror_.size(); }
    auto is_dirty() const noexcept -> bool { return dirty_flag_; }
    auto handle() const noexcept -> H const& { return view_.handle(); }

    /* Changes the default binding target of the underlying buffer. The
     * handle itself stays read-only so its storage can't drift from the
     * host copy.
     */
    auto set_target(opengl::BufferTarget target) noexcept -> void
        requires requires(H& handle, opengl::BufferTarget value) {
            handle.set_target(value);
        }
    {
        view_.handle().set_target(target);
    }

    auto get(std::size_t index) const -> T
    {
        GM_EXPECT_INDEX(index, len());
        return mirror_[index];
    }

    auto operator[](std::size_t index) const -> T const&
    {
        GM_EXPECT_INDEX(index, len());
        return mirror_[index];
    }

    auto set(std::size_t index, T const& value) -> void
    {
        GM_EXPECT_INDEX(index, len());
        mirror_[index] = value;
        mark_dirty({ index, index + 1 });
    }

    /* The item is marked dirty whether or not the caller writes to it.
     */
    auto at_mut(std::size_t index) -> T&
    {
        GM_EXPECT_INDEX(index, len());
        mark_dirty({ index, index + 1 });
        return mirror_[index];
    }

    template <RangeShape R>
    auto slice(R shape) const -> std::span<T const>
    {
        auto const range = resolve(shape, len());
        return { mirror_.data() + range.first, range.size() };
    }

    template <RangeShape R>
    auto slice_mut(R shape) -> std::span<T>
    {
        auto const range = resolve(shape, len());
        mark_dirty(range);
        return { mirror_.data() + range.first, range.size() };
    }

    template <RangeShape R>
    auto fill(R shape, T const& value) -> void
    {
        std::ranges::fill(slice_mut(shape), value);
    }

    auto set_slice(std::size_t start, std::span<T const> items) -> void
    {
        GM_EXPECT(start <= len() && items.size() <= len() - start);
        std::ranges::copy(items, mirror_.begin() + start);
        mark_dirty({ start, start + items.size() });
    }

    /* Growing past `capacity()` flushes, then reallocates the device
     * storage; the buffer is clean afterwards. Otherwise only the host copy
     * changes: slots exposed by growth hold `fill` and are dirty, and
     * nothing past the new length stays dirty.
     *
     * If reallocation throws the buffer is left as it was.
     */
    auto resize(std::size_t new_len, T const& fill) -> void
    {
        if (new_len > capacity()) {
            flush();

            std::vector<T> mirror;
            mirror.reserve(new_len);
            mirror.assign(mirror_.begin(), mirror_.begin() + len());
            mirror.resize(new_len, fill);
            std::vector<bool> dirty(new_len, false);

            view_.resize(new_len, fill);

            mirror_ = std::move(mirror);
            dirty_ = std::move(dirty);
            dirty_flag_ = false;
            return;
        }

        auto const old_len = len();
        if (new_len > old_len) {
            std::fill(mirror_.begin() + old_len, mirror_.begin() + new_len,
                      fill);
            view_.set_len(new_len);
            mark_dirty({ old_len, new_len });
            return;
        }

        std::fill(dirty_.begin() + new_len, dirty_.end(), false);
        dirty_flag_ = std::find(dirty_.begin(), dirty_.begin() + new_len,
                                true) != dirty_.begin() + new_len;
        view_.set_len(new_len);
    }

    /* Flushes, then reallocates the device storage to exactly `len()`
     * items.
     */
    auto shrink_to_fit() -> void
    {
        if (capacity() == len())
            return;

        flush();

        std::vector<T> mirror(mirror_.begin(), mirror_.begin() + len());
        std::vector<bool> dirty(len(), false);

        view_.shrink_to_fit();

        mirror_ = std::move(mirror);
        dirty_ = std::move(dirty);
        dirty_flag_ = false;
    }

    /* Writes every dirty run to the device. Runs separated by at most
     * `kMaximumFlushGap` clean items are merged into one write, each
     * written at its own starting index. A run's dirty marks are cleared
     * once its write has succeeded, so a throwing write leaves the runs it
     * didn't reach dirty.
     */
    auto flush() -> void
    {
        if (!dirty_flag_)
            return;

        auto const n = len();
        bool in_run = false;
        std::size_t run_start = 0;
        std::size_t run_end = 0;
        std::size_t gap_length = 0;
        std::size_t runs_written = 0;
        std::size_t items_written = 0;

        auto write_run = [&] {
            auto const count = run_end - run_start + 1;
            view_.set_slice(
                run_start,
                std::span<T const> { mirror_.data() + run_start, count });
            std::fill(dirty_.begin() + run_start,
                      dirty_.begin() + run_end + 1,
                      false);
            ++runs_written;
            items_written += count;
        };

        for (std::size_t i = 0; i < n; ++i) {
            if (dirty_[i]) {
                if (!in_run) {
                    in_run = true;
                    run_start = i;
                }
                run_end = i;
                gap_length = 0;
            }
            else if (in_run) {
                if (gap_length < kMaximumFlushGap) {
                    ++gap_length;
                }
                else {
                    write_run();
                    in_run = false;
                    gap_length = 0;
                }
            }
        }

        if (in_run)
            write_run();

        dirty_flag_ = false;

        log(LogLevel::debug,
            "Flushed %zu items in %zu writes",
            items_written,
            runs_written);
    }

    [[nodiscard]] auto into_static() && -> view_type
    {
        flush();
        return std::move(view_);
    }

    [[nodiscard]] auto into_handle() && -> H
    {
        flush();
        return std::move(view_).release();
    }

    /* Copies the device storage, the host copy and the pending writes.
     */
    [[nodiscard]] auto clone() const -> DynamicBuffer
    {
        return DynamicBuffer { view_.clone(), mirror_, dirty_, dirty_flag_ };
    }

private:
    DynamicBuffer(view_type view,
                  std::vector<T> mirror,
                  std::vector<bool> dirty,
                  bool dirty_flag) noexcept
        : view_ { std::move(view) }
        , mirror_ { std::move(mirror) }
        , dirty_ { std::move(dirty) }
        , dirty_flag_ { dirty_flag }
    {
    }

    static auto full_view(H handle) -> view_type
    {
        auto const capacity = handle.size_in_bytes() / sizeof(T);
        return view_type { std::move(handle), capacity };
    }

    auto mark_dirty(IndexRange range) noexcept -> void
    {
        if (range.empty())
            return;

        std::fill(dirty_.begin() + range.first,
                  dirty_.begin() + range.last,
                  true);
        dirty_flag_ = true;
    }

    auto discard_pending() noexcept -> void
    {
        if (!dirty_flag_)
            return;

        auto const pending =
            std::count(dirty_.begin(), dirty_.begin() + len(), true);
        log(LogLevel::debug,
            "Discarding %td unflushed items",
            static_cast<std::ptrdiff_t>(pending));
        dirty_flag_ = false;
    }

    view_type view_;
    std::vector<T> mirror_;
    std::vector<bool> dirty_;
    bool dirty_flag_ { false };
};

} // namespace gm

#endif // GLMIRROR_BUFFER_DYNAMIC_BUFFER_HPP_INCLUDED
