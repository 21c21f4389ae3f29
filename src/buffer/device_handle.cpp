#include "buffer/device_handle.hpp"

namespace gm
{
auto to_string(MapAccess access) noexcept -> char const*
{
    switch (access) {
    case MapAccess::read_only:
        return "ReadOnly";
    case MapAccess::write_only:
        return "WriteOnly";
    case MapAccess::read_write:
    default:
        return "ReadWrite";
    }
}
} // namespace gm
