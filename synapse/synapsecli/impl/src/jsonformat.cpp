#include "jsonformat.hpp"

#include <utility>

#include "timeformat.hpp"

namespace synapsecli
{
nlohmann::json to_json(const synapse::model::Shard &shard)
{
    nlohmann::json json {{"file_path", shard.file_path}, {"display_name", shard.display_name},
        {"embedding_model", shard.embedding_model}, {"dimensions", shard.dimensions},
        {"entry_count", shard.entry_count}, {"tags", shard.tags},
        {"content_hash", shard.content_hash}, {"signed", shard.signature.has_value()}};
    if (shard.creator_id)
    {
        json["creator_id"] = *shard.creator_id;
    }
    return json;
}

nlohmann::json to_json(const synapse::model::Link &link)
{
    nlohmann::json json {{"content_hash", link.content_hash},
        {"display_name", link.display_name}, {"trackers", link.trackers},
        {"tags", link.tags}, {"file_size", link.file_size}};
    if (link.embedding_model)
    {
        json["embedding_model"] = *link.embedding_model;
    }
    if (link.dimensions)
    {
        json["dimensions"] = *link.dimensions;
    }
    if (link.creator_id)
    {
        json["creator_id"] = *link.creator_id;
    }
    return json;
}

nlohmann::json to_json(const synapse::transfer::SessionStatus &status)
{
    nlohmann::json json {{"content_hash", status.content_hash}, {"file_path", status.file_path},
        {"status", synapse::transfer::to_string(status.status)}, {"progress", status.progress},
        {"peers", status.peer_count}, {"total_size", status.total_size},
        {"uploaded", status.uploaded}, {"downloaded", status.downloaded},
        {"share_ratio", status.share_ratio},
        {"started_at", synapse::utils::format_iso8601(status.started_at)}};
    if (status.completed_at)
    {
        json["completed_at"] = synapse::utils::format_iso8601(*status.completed_at);
    }
    if (status.error)
    {
        json["error"] = *status.error;
    }
    return json;
}

nlohmann::json to_json(const synapse::NodeStatistics &statistics)
{
    return {{"node_id", statistics.node_id}, {"uptime_seconds", statistics.uptime_seconds},
        {"total_uploaded", statistics.total_uploaded},
        {"total_downloaded", statistics.total_downloaded},
        {"active_sessions", statistics.active_sessions},
        {"active_downloads", statistics.active_downloads},
        {"active_seeds", statistics.active_seeds}, {"known_peers", statistics.known_peers}};
}

nlohmann::json make_success_document(nlohmann::json result)
{
    nlohmann::json document = std::move(result);
    if (!document.is_object())
    {
        document = nlohmann::json::object();
    }
    document["status"] = "success";
    return document;
}

nlohmann::json make_error_document(const synapse::model::Error &error)
{
    return {{"status", "error"}, {"error", error.message},
        {"code", synapse::model::to_string(error.code)}};
}
}  // namespace synapsecli
