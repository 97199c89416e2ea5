#ifndef SYNAPSE_CONFIG_CONFIGKEYS_HPP_
#define SYNAPSE_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace synapse::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        NODE_ID = FIRST_KEY,
        LISTEN_PORT,
        DATA_DIR,
        TRACKERS,
        PEER_LIVENESS_WINDOW,
        DISCOVERY_TIMEOUT,
        ANNOUNCE_TIMEOUT,
        PEER_CACHE_REFRESH_PERIOD,
        MIN_TRUST_SCORE,
        REQUIRE_SIGNATURES,
        HASH_ALGORITHM,
        PEER_LIST_FILE,
        IDENTITY_DIR,
        TRUST_SCORES_FILE,
        WORKER_THREAD_COUNT,

        KEY_COUNT
    };

    ConfigKey(const std::string &str_key);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"node_id", "listen_port", "data_dir", "trackers",
        "peer_liveness_window", "discovery_timeout", "announce_timeout",
        "peer_cache_refresh_period", "min_trust_score", "require_signatures", "hash_algorithm",
        "peer_list_file", "identity_dir", "trust_scores_file", "worker_thread_count"};

    static_assert(sizeof(string_vals) / sizeof(string_vals[0]) == KEY_COUNT);
};
}  // namespace synapse::config

#endif  // SYNAPSE_CONFIG_CONFIGKEYS_HPP_
