#ifndef SYNAPSECLI_JSONFORMAT_HPP_
#define SYNAPSECLI_JSONFORMAT_HPP_

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "link.hpp"
#include "nodestatistics.hpp"
#include "sessionstatus.hpp"
#include "shard.hpp"

namespace synapsecli
{
nlohmann::json to_json(const synapse::model::Shard &shard);
nlohmann::json to_json(const synapse::model::Link &link);
nlohmann::json to_json(const synapse::transfer::SessionStatus &status);
nlohmann::json to_json(const synapse::NodeStatistics &statistics);

nlohmann::json make_success_document(nlohmann::json result);
nlohmann::json make_error_document(const synapse::model::Error &error);
}  // namespace synapsecli

#endif  // SYNAPSECLI_JSONFORMAT_HPP_
