#ifndef SYNAPSE_API_SHARDOPTIONS_HPP_
#define SYNAPSE_API_SHARDOPTIONS_HPP_

#include <string>
#include <vector>

namespace synapse
{
// Descriptive parameters of a new shard
struct ShardOptions
{
    static constexpr char const *default_embedding_model = "claw-v3-small";
    static constexpr unsigned    default_dimensions      = 1536;

    std::string              source_path;
    std::string              display_name;
    std::string              embedding_model = default_embedding_model;
    unsigned                 dimensions      = default_dimensions;
    unsigned long long       entry_count     = 0;
    std::vector<std::string> tags;
};
}  // namespace synapse

#endif  // SYNAPSE_API_SHARDOPTIONS_HPP_
