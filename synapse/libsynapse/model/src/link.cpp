#include "link.hpp"

#include "hexencoding.hpp"

namespace synapse::model
{
bool operator==(const Link &lhs, const Link &rhs)
{
    return utils::to_lower_ascii(lhs.content_hash) == utils::to_lower_ascii(rhs.content_hash);
}

bool operator!=(const Link &lhs, const Link &rhs)
{
    return !(lhs == rhs);
}
}  // namespace synapse::model
