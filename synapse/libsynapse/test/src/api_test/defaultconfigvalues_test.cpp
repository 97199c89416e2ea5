#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "defaultconfigvalues.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::synapse;
using namespace ::synapse::config;

namespace
{
class DefaultConfigValuesTest : public Test
{
protected:
    void SetUp() override
    {
        ON_CALL(config_loader_, load()).WillByDefault(Return(ConfigLoaderMock::ConfigMap {}));
    }

    NiceMock<ConfigLoaderMock> config_loader_;
};
}  // namespace

TEST_F(DefaultConfigValuesTest, EveryKeyHasAWellTypedDefault)
{
    Config cfg {config_loader_, std::make_unique<DefaultConfigValues>("/var/lib/synapse")};

    EXPECT_EQ(cfg.get_string(ConfigKey::NODE_ID), "");
    EXPECT_EQ(cfg.get_integer(ConfigKey::LISTEN_PORT), 6881);
    EXPECT_EQ(cfg.get_string(ConfigKey::DATA_DIR), "/var/lib/synapse");
    EXPECT_EQ(cfg.get_string_list(ConfigKey::TRACKERS).size(), 2u);
    EXPECT_EQ(cfg.get_integer(ConfigKey::PEER_LIVENESS_WINDOW), 300);
    EXPECT_EQ(cfg.get_integer(ConfigKey::DISCOVERY_TIMEOUT), 30);
    EXPECT_EQ(cfg.get_integer(ConfigKey::ANNOUNCE_TIMEOUT), 10);
    EXPECT_EQ(cfg.get_integer(ConfigKey::PEER_CACHE_REFRESH_PERIOD), 0);
    EXPECT_DOUBLE_EQ(cfg.get_float(ConfigKey::MIN_TRUST_SCORE), 0.6);
    EXPECT_FALSE(cfg.get_bool(ConfigKey::REQUIRE_SIGNATURES));
    EXPECT_EQ(cfg.get_string(ConfigKey::HASH_ALGORITHM), "sha256");
    EXPECT_EQ(cfg.get_string(ConfigKey::PEER_LIST_FILE), "peers.txt");
    EXPECT_EQ(cfg.get_string(ConfigKey::IDENTITY_DIR), "identity");
    EXPECT_EQ(cfg.get_string(ConfigKey::TRUST_SCORES_FILE), "trust_scores.json");
    EXPECT_EQ(cfg.get_integer(ConfigKey::WORKER_THREAD_COUNT), 0);
}

TEST_F(DefaultConfigValuesTest, LoadedValuesWin)
{
    ON_CALL(config_loader_, load())
        .WillByDefault(Return(ConfigLoaderMock::ConfigMap {
            {"listen_port", 7000LL}, {"trackers", std::vector<std::string> {"udp://a:1"}}}));

    Config cfg {config_loader_, std::make_unique<DefaultConfigValues>()};

    EXPECT_EQ(cfg.get_integer(ConfigKey::LISTEN_PORT), 7000);
    EXPECT_EQ(cfg.get_string_list(ConfigKey::TRACKERS), std::vector<std::string> {"udp://a:1"});
    EXPECT_EQ(cfg.get_string(ConfigKey::DATA_DIR), "./synapse_data");
}
