#ifndef SYNAPSE_MODEL_LINK_HPP_
#define SYNAPSE_MODEL_LINK_HPP_

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace synapse::model
{
// Content addressed descriptor of a shard. Carries no payload bytes.
struct Link
{
    std::string                content_hash;
    std::string                display_name;
    std::vector<std::string>   trackers;
    std::optional<std::string> embedding_model;
    std::optional<unsigned>    dimensions;
    std::set<std::string>      tags;
    unsigned long long         file_size = 0;
    std::optional<std::string> creator_id;
    std::optional<std::string> creator_public_key;

    [[nodiscard]] std::optional<std::string> default_tracker() const
    {
        if (trackers.empty())
        {
            return std::nullopt;
        }
        return trackers.front();
    }
};

// Two links with the same content hash refer to the same bytes
bool operator==(const Link &lhs, const Link &rhs);
bool operator!=(const Link &lhs, const Link &rhs);
}  // namespace synapse::model

#endif  // SYNAPSE_MODEL_LINK_HPP_
