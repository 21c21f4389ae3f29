#include "buffer/dynamic_buffer.hpp"
#include "buffer/static_buffer.hpp"
#include "error.hpp"
#include "host_device.hpp"
#include "testing.hpp"
#include <array>
#include <cstdint>
#include <numeric>
#include <vector>

using testing::DeviceStats;
using testing::HostDeviceBuffer;
using View = gm::StaticBuffer<std::uint32_t, HostDeviceBuffer>;
using Buffer = gm::DynamicBuffer<std::uint32_t, HostDeviceBuffer>;

namespace
{
constexpr auto item_size = sizeof(std::uint32_t);

auto iota(std::size_t count) -> std::vector<std::uint32_t>
{
    std::vector<std::uint32_t> items(count);
    std::iota(items.begin(), items.end(), 0u);
    return items;
}

auto make_buffer(std::vector<std::uint32_t> const& items,
                 std::shared_ptr<DeviceStats> const& stats) -> Buffer
{
    return Buffer { HostDeviceBuffer::from_items(items, stats) };
}

/* Writes recorded since construction, as (first item, item count).
 */
auto writes_in_items(DeviceStats const& stats)
    -> std::vector<std::pair<std::size_t, std::size_t>>
{
    std::vector<std::pair<std::size_t, std::size_t>> writes;
    for (auto const& write : stats.writes)
        writes.emplace_back(write.offset / item_size, write.length / item_size);
    return writes;
}

} // namespace

auto should_construct_from_a_single_bulk_read() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto items = iota(10);
    Buffer buffer { View { HostDeviceBuffer::from_items(items, stats), 6 } };

    EXPECT(stats->reads == 1);
    EXPECT(stats->writes.empty());
    EXPECT(buffer.len() == 6);
    EXPECT(buffer.capacity() == 10);
    EXPECT(!buffer.is_dirty());
    for (std::size_t i = 0; i < buffer.len(); ++i)
        EXPECT(buffer.get(i) == items[i]);
}

auto should_treat_whole_handle_as_populated() -> void
{
    auto buffer = make_buffer(iota(5), std::make_shared<DeviceStats>());
    EXPECT(buffer.len() == 5);
    EXPECT(buffer.capacity() == 5);
    EXPECT(buffer[4] == 4);
}

auto should_serve_reads_from_host_copy() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(8), stats);

    auto const reads = stats->reads;
    static_cast<void>(buffer.get(3));
    static_cast<void>(buffer[7]);
    static_cast<void>(buffer.slice(gm::Full {}));
    EXPECT(stats->reads == reads);
}

auto should_write_only_the_final_value() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(32, 0), stats);

    buffer.set(3, 99);
    buffer.set(3, 7);
    EXPECT(buffer.is_dirty());
    EXPECT(stats->writes.empty());

    buffer.flush();
    EXPECT(!buffer.is_dirty());
    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 3, 1 } }));
    EXPECT(buffer.handle().item<std::uint32_t>(3) == 7);
}

auto should_keep_pending_writes_across_reallocation() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(32, 0), stats);

    buffer.set(3, 7);
    buffer.flush();
    buffer.set(10, 5);

    buffer.resize(41, 0);
    EXPECT(stats->reallocations == 1);
    EXPECT(!buffer.is_dirty());
    EXPECT(buffer.capacity() == 41);
    EXPECT(buffer.len() == 41);
    EXPECT(buffer.handle().item<std::uint32_t>(10) == 5);
    EXPECT(buffer.handle().item<std::uint32_t>(3) == 7);
    EXPECT(buffer.handle().item<std::uint32_t>(40) == 0);

    buffer.set(40, 5);
    EXPECT(buffer.get(40) == 5);
}

auto should_bridge_a_gap_of_sixteen_clean_items() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(64, 0), stats);

    buffer.set(0, 1);
    buffer.set(17, 1);
    buffer.flush();

    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 0, 18 } }));
}

auto should_split_a_gap_of_seventeen_clean_items() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(64, 0), stats);

    buffer.set(0, 1);
    buffer.set(18, 2);
    buffer.flush();

    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 0, 1 },
                                                               { 18, 1 } }));
    EXPECT(buffer.handle().item<std::uint32_t>(0) == 1);
    EXPECT(buffer.handle().item<std::uint32_t>(18) == 2);
}

auto should_split_runs_seventeen_apart() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(23, 0), stats);

    for (std::size_t i : { 0, 1, 2, 20, 21, 22 })
        buffer.set(i, 1);
    buffer.flush();

    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 0, 3 },
                                                               { 20, 3 } }));
}

auto should_coalesce_adjacent_writes() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(100, 0), stats);

    for (std::size_t i = 10; i < 20; ++i)
        buffer.set(i, static_cast<std::uint32_t>(i));
    buffer.set(25, 25);
    buffer.set(60, 60);
    buffer.set(99, 99);
    buffer.flush();

    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> {
                { 10, 16 }, { 60, 1 }, { 99, 1 } }));

    auto const device = buffer.handle().items<std::uint32_t>();
    for (std::size_t i = 0; i < device.size(); ++i)
        EXPECT(device[i] == buffer.get(i));
}

auto should_not_write_when_clean() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(16), stats);

    buffer.flush();
    EXPECT(stats->writes.empty());

    buffer.set(1, 100);
    buffer.flush();
    buffer.flush();
    EXPECT(stats->writes.size() == 1);
}

auto should_leave_unwritten_runs_dirty_on_failure() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(64, 0), stats);

    buffer.set(0, 1);
    buffer.set(40, 2);

    stats->fail_next_map = true;
    EXPECT_THROWS_AS(buffer.flush(), gm::DeviceError);
    EXPECT(buffer.is_dirty());
    EXPECT(stats->writes.empty());

    buffer.flush();
    EXPECT(!buffer.is_dirty());
    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 0, 1 },
                                                               { 40, 1 } }));
}

auto should_keep_run_dirty_when_unmap_fails() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(64, 0), stats);

    buffer.set(0, 1);
    buffer.set(40, 2);

    stats->fail_next_unmap = true;
    EXPECT_THROWS_AS(buffer.flush(), gm::DeviceError);
    EXPECT(buffer.is_dirty());
    EXPECT(buffer.handle().item<std::uint32_t>(40) == 0);

    buffer.flush();
    EXPECT(!buffer.is_dirty());
    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> {
                { 0, 1 }, { 0, 1 }, { 40, 1 } }));
    EXPECT(buffer.handle().item<std::uint32_t>(0) == 1);
    EXPECT(buffer.handle().item<std::uint32_t>(40) == 2);
}

auto should_keep_state_when_reallocation_fails() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(8), stats);

    buffer.set(2, 50);
    stats->fail_next_reallocation = true;
    EXPECT_THROWS_AS(buffer.resize(20, 0), gm::DeviceError);

    EXPECT(buffer.len() == 8);
    EXPECT(buffer.capacity() == 8);
    EXPECT(buffer.get(2) == 50);
    EXPECT(buffer.handle().size_in_bytes() == 8 * item_size);

    /* The pending write was flushed before the device call.
     */
    EXPECT(buffer.handle().item<std::uint32_t>(2) == 50);
    EXPECT(!buffer.is_dirty());

    buffer.resize(20, 1);
    EXPECT(buffer.capacity() == 20);
    EXPECT(buffer.get(19) == 1);
}

auto should_truncate_on_shrink() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(10), stats);

    buffer.set(8, 80);
    buffer.resize(5, 0);
    EXPECT(buffer.len() == 5);
    EXPECT(buffer.capacity() == 10);
    EXPECT(!buffer.is_dirty());

    buffer.flush();
    EXPECT(stats->writes.empty());
    EXPECT(buffer.handle().item<std::uint32_t>(8) == 8);
}

auto should_mark_regrown_slots_dirty() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(10), stats);

    buffer.resize(4, 0);
    buffer.resize(7, 42);
    EXPECT(stats->reallocations == 0);
    EXPECT(buffer.is_dirty());
    EXPECT(buffer.get(4) == 42 && buffer.get(6) == 42);

    buffer.flush();
    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 4, 3 } }));
    EXPECT(buffer.handle().item<std::uint32_t>(6) == 42);
    EXPECT(buffer.handle().item<std::uint32_t>(7) == 7);
}

auto should_shrink_to_fit_after_flushing() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(10), stats);

    buffer.set(1, 11);
    buffer.resize(3, 0);
    buffer.shrink_to_fit();

    EXPECT(buffer.len() == 3);
    EXPECT(buffer.capacity() == 3);
    EXPECT(!buffer.is_dirty());
    EXPECT((buffer.handle().items<std::uint32_t>() ==
            std::vector<std::uint32_t> { 0, 11, 2 }));
}

auto should_mark_exactly_the_covered_indices() -> void
{
    auto check = [](auto shape,
                    std::vector<std::pair<std::size_t, std::size_t>> expected) {
        auto stats = std::make_shared<DeviceStats>();
        auto buffer = make_buffer(std::vector<std::uint32_t>(100, 0), stats);
        buffer.fill(shape, 1);
        buffer.flush();
        EXPECT(writes_in_items(*stats) == expected);
    };

    check(gm::HalfOpen { 10, 20 }, { { 10, 10 } });
    check(gm::From { 90 }, { { 90, 10 } });
    check(gm::To { 5 }, { { 0, 5 } });
    check(gm::Full {}, { { 0, 100 } });
    check(gm::Inclusive { 10, 20 }, { { 10, 11 } });
    check(gm::ToInclusive { 5 }, { { 0, 6 } });
    check(std::size_t { 42 }, { { 42, 1 } });
    check(gm::HalfOpen { 10, 10 }, {});
}

auto should_write_through_mutable_slices() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(std::vector<std::uint32_t>(64, 0), stats);

    auto items = buffer.slice_mut(gm::HalfOpen { 4, 8 });
    EXPECT(items.size() == 4);
    items[0] = 1;
    items[3] = 4;
    buffer.at_mut(20) = 20;

    std::array<std::uint32_t, 2> const values { 50, 51 };
    buffer.set_slice(50, values);

    EXPECT(buffer.slice(gm::HalfOpen { 50, 52 })[1] == 51);
    buffer.flush();
    EXPECT((writes_in_items(*stats) ==
            std::vector<std::pair<std::size_t, std::size_t>> { { 4, 17 },
                                                               { 50, 2 } }));
    EXPECT(buffer.handle().item<std::uint32_t>(7) == 4);
    EXPECT(buffer.handle().item<std::uint32_t>(20) == 20);
}

auto should_flush_when_converted() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(8), stats);
    buffer.resize(6, 0);
    buffer.set(5, 55);

    auto view = std::move(buffer).into_static();
    EXPECT(stats->writes.size() == 1);
    EXPECT(view.len() == 6);
    EXPECT(view.get(5) == 55);

    Buffer second { std::move(view) };
    second.set(0, 1);
    auto handle = std::move(second).into_handle();
    EXPECT(stats->writes.size() == 2);
    EXPECT(handle.item<std::uint32_t>(0) == 1);
}

auto should_discard_pending_writes_on_destruction() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    {
        auto buffer = make_buffer(iota(8), stats);
        buffer.set(2, 22);
        EXPECT(buffer.is_dirty());
    }
    EXPECT(stats->writes.empty());
}

auto should_clone_pending_state() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(8), stats);
    buffer.set(1, 10);

    auto copy = buffer.clone();
    EXPECT(stats->clones == 1);
    EXPECT(copy.is_dirty());
    EXPECT(copy.get(1) == 10);

    copy.set(2, 20);
    copy.flush();
    EXPECT(copy.handle().item<std::uint32_t>(1) == 10);
    EXPECT(copy.handle().item<std::uint32_t>(2) == 20);
    EXPECT(buffer.handle().item<std::uint32_t>(1) == 1);
    EXPECT(buffer.get(2) == 2);
    EXPECT(buffer.is_dirty());
}

auto should_reset_moved_from_buffer() -> void
{
    auto stats = std::make_shared<DeviceStats>();
    auto buffer = make_buffer(iota(8), stats);
    buffer.set(1, 10);

    Buffer moved { std::move(buffer) };
    EXPECT(moved.is_dirty());
    EXPECT(moved.len() == 8);
    EXPECT(!buffer.is_dirty());
    EXPECT(buffer.len() == 0);
    EXPECT(buffer.capacity() == 0);
    EXPECT(buffer.handle().size_in_bytes() == 0);

    moved.flush();
    EXPECT(stats->writes.size() == 1);

    auto target = make_buffer(iota(2), stats);
    target = std::move(moved);
    EXPECT(target.len() == 8);
    EXPECT(target.get(1) == 10);
    EXPECT(moved.len() == 0);
    EXPECT(moved.capacity() == 0);
}

auto main() -> int
{
    return testing::run(
        { TEST(should_construct_from_a_single_bulk_read),
          TEST(should_treat_whole_handle_as_populated),
          TEST(should_serve_reads_from_host_copy),
          TEST(should_write_only_the_final_value),
          TEST(should_keep_pending_writes_across_reallocation),
          TEST(should_bridge_a_gap_of_sixteen_clean_items),
          TEST(should_split_a_gap_of_seventeen_clean_items),
          TEST(should_split_runs_seventeen_apart),
          TEST(should_coalesce_adjacent_writes),
          TEST(should_not_write_when_clean),
          TEST(should_leave_unwritten_runs_dirty_on_failure),
          TEST(should_keep_run_dirty_when_unmap_fails),
          TEST(should_keep_state_when_reallocation_fails),
          TEST(should_truncate_on_shrink),
          TEST(should_mark_regrown_slots_dirty),
          TEST(should_shrink_to_fit_after_flushing),
          TEST(should_mark_exactly_the_covered_indices),
          TEST(should_write_through_mutable_slices),
          TEST(should_flush_when_converted),
          TEST(should_discard_pending_writes_on_destruction),
          TEST(should_clone_pending_state),
          TEST(should_reset_moved_from_buffer) });
}
