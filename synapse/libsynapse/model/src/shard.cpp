#include "shard.hpp"

#include <sstream>

namespace synapse::model
{
std::string Shard::signed_payload() const
{
    std::ostringstream ss;
    ss << content_hash << '\n'
       << display_name << '\n'
       << embedding_model << '\n'
       << dimensions << '\n'
       << entry_count << '\n'
       << creator_id.value_or("");
    return ss.str();
}
}  // namespace synapse::model
