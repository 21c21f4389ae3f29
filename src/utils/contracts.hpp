#ifndef GLMIRROR_UTILS_CONTRACTS_HPP_INCLUDED
#define GLMIRROR_UTILS_CONTRACTS_HPP_INCLUDED

#include <cstddef>
#include <source_location>

#define GM_STRINGIFY_IMPL(s) #s
#define GM_STRINGIFY(s) GM_STRINGIFY_IMPL(s)
#define GM_EXPECT(cond)                                                        \
    do {                                                                       \
        if (!(cond)) {                                                         \
            ::gm::contract_check_failed(GM_STRINGIFY(cond));                   \
            __builtin_unreachable();                                           \
        }                                                                      \
    }                                                                          \
    while (0)

/* Index checks are the common case; keep the failing values in the message.
 */
#define GM_EXPECT_INDEX(index, bound)                                          \
    do {                                                                       \
        if (!((index) < (bound))) {                                            \
            ::gm::index_check_failed((index), (bound));                        \
            __builtin_unreachable();                                           \
        }                                                                      \
    }                                                                          \
    while (0)

namespace gm
{

[[noreturn]] auto contract_check_failed(
    char const* /*msg*/,
    std::source_location /*loc*/ = std::source_location::current()) -> void;

[[noreturn]] auto index_check_failed(
    std::size_t index,
    std::size_t bound,
    std::source_location /*loc*/ = std::source_location::current()) -> void;

} // namespace gm

#endif // GLMIRROR_UTILS_CONTRACTS_HPP_INCLUDED
