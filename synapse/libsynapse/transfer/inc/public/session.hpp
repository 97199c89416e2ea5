#ifndef SYNAPSE_TRANSFER_SESSION_HPP_
#define SYNAPSE_TRANSFER_SESSION_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "completiontoken.hpp"
#include "peer.hpp"
#include "sessionstatus.hpp"

namespace synapse::transfer
{
/*
 * Transfer state of one content hash on one node. All members are guarded by the session mutex so
 * the transfer loop can update counters while other threads read snapshots.
 *
 *   create_for_seed     -> SEEDING
 *   create_for_download -> DOWNLOADING
 *   DOWNLOADING         -> SEEDING  (complete, needs downloaded == total)
 *   DOWNLOADING/SEEDING -> PAUSED   (pause, cancels the completion token)
 *   IDLE/DOWNLOADING/SEEDING -> ERROR (fail)
 */
class Session
{
public:
    using Status    = SessionStatus::Status;
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    Session(std::string content_hash, std::string file_path, unsigned long long total_size,
        Status initial_status);

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    static std::shared_ptr<Session> create_for_seed(
        std::string content_hash, std::string file_path, unsigned long long total_size);
    static std::shared_ptr<Session> create_for_download(
        std::string content_hash, std::string file_path, unsigned long long total_size);

    [[nodiscard]] const std::string          &content_hash() const;
    [[nodiscard]] const std::string          &file_path() const;
    [[nodiscard]] unsigned long long          total_size() const;
    [[nodiscard]] unsigned long long          downloaded() const;
    [[nodiscard]] unsigned long long          uploaded() const;
    [[nodiscard]] Status                      status() const;
    [[nodiscard]] bool                        is_active() const;
    [[nodiscard]] double                      progress() const;
    [[nodiscard]] double                      share_ratio() const;
    [[nodiscard]] bool                        is_complete() const;
    [[nodiscard]] std::optional<std::string>  error_message() const;
    [[nodiscard]] std::vector<model::Peer>    peers() const;
    [[nodiscard]] const utils::CompletionToken &completion_token() const;
    [[nodiscard]] SessionStatus               snapshot() const;

    bool add_downloaded(unsigned long long bytes);
    bool add_uploaded(unsigned long long bytes);
    void set_peers(std::vector<model::Peer> peers);
    bool complete();
    bool fail(std::string message);
    bool pause();

private:
    [[nodiscard]] bool   is_active_internal() const;
    [[nodiscard]] double progress_internal() const;
    [[nodiscard]] double share_ratio_internal() const;

    const std::string               content_hash_;
    const std::string               file_path_;
    const unsigned long long        total_size_;
    unsigned long long              downloaded_;
    unsigned long long              uploaded_;
    std::vector<model::Peer>        peers_;
    Status                          status_;
    const TimePoint                 started_at_;
    std::optional<TimePoint>        completed_at_;
    std::optional<std::string>      error_message_;
    const utils::CompletionToken    completion_token_;
    mutable std::mutex              mutex_;
};
}  // namespace synapse::transfer

#endif  // SYNAPSE_TRANSFER_SESSION_HPP_
