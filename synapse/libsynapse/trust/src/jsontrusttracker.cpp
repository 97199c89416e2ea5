#include "jsontrusttracker.hpp"

#include <fstream>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace synapse::trust
{
JSONTrustTracker::JSONTrustTracker(std::string file_path)
    : file_path_ {std::move(file_path)}
{
    load();
}

double JSONTrustTracker::get_trust_score(const std::string &agent_id) const
{
    auto it = scores_.find(agent_id);
    if (it == scores_.end())
    {
        return 0.0;
    }
    return it->second;
}

size_t JSONTrustTracker::size() const
{
    return scores_.size();
}

void JSONTrustTracker::load()
{
    std::ifstream fs {file_path_};
    if (!fs)
    {
        LOG(INFO) << "Trust score file " << file_path_ << " not present, every creator scores 0";
        return;
    }

    auto json_root = nlohmann::json::parse(fs, nullptr, false);
    if (json_root.is_discarded() || !json_root.is_object())
    {
        LOG(WARNING) << "Trust score file " << file_path_ << " parse error, ignoring it";
        return;
    }

    for (const auto &[agent_id, score] : json_root.items())
    {
        if (!score.is_number())
        {
            LOG(WARNING) << "Trust score of " << agent_id << " is not a number, skipping entry";
            continue;
        }
        scores_.emplace(agent_id, score.get<double>());
    }
}
}  // namespace synapse::trust
