#ifndef GLMIRROR_BUFFER_RANGE_HPP_INCLUDED
#define GLMIRROR_BUFFER_RANGE_HPP_INCLUDED

#include "utils/contracts.hpp"
#include <concepts>
#include <cstddef>

namespace gm
{

/* Index ranges accepted by the ranged buffer accessors. Each one is
 * resolved against the populated length of the buffer.
 */

/* [first, last)
 */
struct HalfOpen
{
    std::size_t first;
    std::size_t last;
};

/* [first, len)
 */
struct From
{
    std::size_t first;
};

/* [0, last)
 */
struct To
{
    std::size_t last;
};

/* [0, len)
 */
struct Full
{
};

/* [first, last]
 */
struct Inclusive
{
    std::size_t first;
    std::size_t last;
};

/* [0, last]
 */
struct ToInclusive
{
    std::size_t last;
};

struct IndexRange
{
    std::size_t first;
    std::size_t last;

    auto size() const noexcept -> std::size_t { return last - first; }
    auto empty() const noexcept -> bool { return first == last; }
};

inline auto resolve(HalfOpen range, std::size_t len) -> IndexRange
{
    GM_EXPECT(range.first <= range.last && range.last <= len);
    return { range.first, range.last };
}

inline auto resolve(From range, std::size_t len) -> IndexRange
{
    GM_EXPECT(range.first <= len);
    return { range.first, len };
}

inline auto resolve(To range, std::size_t len) -> IndexRange
{
    GM_EXPECT(range.last <= len);
    return { 0, range.last };
}

inline auto resolve(Full, std::size_t len) noexcept -> IndexRange
{
    return { 0, len };
}

inline auto resolve(Inclusive range, std::size_t len) -> IndexRange
{
    GM_EXPECT(range.first <= range.last);
    GM_EXPECT_INDEX(range.last, len);
    return { range.first, range.last + 1 };
}

inline auto resolve(ToInclusive range, std::size_t len) -> IndexRange
{
    GM_EXPECT_INDEX(range.last, len);
    return { 0, range.last + 1 };
}

inline auto resolve(std::size_t index, std::size_t len) -> IndexRange
{
    GM_EXPECT_INDEX(index, len);
    return { index, index + 1 };
}

// clang-format off
template<typename R>
concept RangeShape = requires (R range, std::size_t len) {
    { resolve(range, len) } -> std::same_as<IndexRange>;
};
// clang-format on

} // namespace gm

#endif // GLMIRROR_BUFFER_RANGE_HPP_INCLUDED
