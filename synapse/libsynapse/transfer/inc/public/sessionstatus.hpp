#ifndef SYNAPSE_TRANSFER_SESSIONSTATUS_HPP_
#define SYNAPSE_TRANSFER_SESSIONSTATUS_HPP_

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace synapse::transfer
{
// Read-only projection of a session taken at one point in time
struct SessionStatus
{
    enum class Status
    {
        IDLE,
        DOWNLOADING,
        SEEDING,
        PAUSED,
        ERROR
    };

    std::string                                          content_hash;
    std::string                                          file_path;
    Status                                               status = Status::IDLE;
    double                                               progress    = 0;
    size_t                                               peer_count  = 0;
    unsigned long long                                   total_size  = 0;
    unsigned long long                                   uploaded    = 0;
    unsigned long long                                   downloaded  = 0;
    double                                               share_ratio = 0;
    std::chrono::system_clock::time_point                started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::string>                           error;
};

[[nodiscard]] std::string to_string(SessionStatus::Status status);
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_SESSIONSTATUS_HPP_
