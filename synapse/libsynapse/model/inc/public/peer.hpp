#ifndef SYNAPSE_MODEL_PEER_HPP_
#define SYNAPSE_MODEL_PEER_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace synapse::model
{
struct Peer
{
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::seconds default_liveness_window {300};

    std::string        peer_id;
    std::string        address;
    uint16_t           port = 0;
    TimePoint          last_seen;
    unsigned long long uploaded   = 0;
    unsigned long long downloaded = 0;

    [[nodiscard]] bool is_alive(
        std::chrono::seconds window = default_liveness_window, TimePoint now = Clock::now()) const
    {
        return now - last_seen < window;
    }
};
}  // namespace synapse::model

#endif  // SYNAPSE_MODEL_PEER_HPP_
