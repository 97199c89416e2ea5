#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "fallbackconfigvalueprovider.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::synapse::config;

namespace
{
class ConfigTest : public Test
{
protected:
    class GoodFallbackValueProviderMock : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &key) const override
        {
            if (key == ConfigKey::DISCOVERY_TIMEOUT)
            {
                return discovery_timeout_;
            }
            else if (key == ConfigKey::IDENTITY_DIR)
            {
                return std::string {identity_dir_};
            }
            return {};
        }

        static constexpr long long   discovery_timeout_ = 30LL;
        static constexpr char const *identity_dir_      = "/home/anon/.synapse/identity";
    };

    class BadFallbackValueProviderMock : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &) const override
        {
            return {};
        }
    };

    class BadFallbackValueProviderMock2 : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &key) const override
        {
            if (key == ConfigKey::IDENTITY_DIR)
            {
                return {5};
            }
            return {};
        }
    };

    void SetUp() override
    {
        ON_CALL(config_loader_, load())
            .WillByDefault(Return(std::map<std::string, std::any> {
                {ConfigKey(ConfigKey::LISTEN_PORT).to_string(), listen_port_},
                {ConfigKey(ConfigKey::PEER_LIST_FILE).to_string(), peer_list_file_},
                {ConfigKey(ConfigKey::REQUIRE_SIGNATURES).to_string(), require_signatures_},
                {ConfigKey(ConfigKey::MIN_TRUST_SCORE).to_string(), min_trust_score_},
                {ConfigKey(ConfigKey::ANNOUNCE_TIMEOUT).to_string(), announce_timeout_},
                {ConfigKey(ConfigKey::TRACKERS).to_string(), trackers_},
                {ConfigKey(ConfigKey::IDENTITY_DIR).to_string(), identity_dir_},
                {"no_such_key", std::string {"ignored"}}}));
    }

    NiceMock<ConfigLoaderMock> config_loader_;

    const long long                listen_port_        = 7000LL;
    const std::string              peer_list_file_     = "/home/anon/peers.txt";
    const bool                     require_signatures_ = true;
    const double                   min_trust_score_    = 0.75;
    const long long                announce_timeout_   = 3LL;
    const std::vector<std::string> trackers_ {"udp://a.example:80", "udp://b.example:80"};
    const bool                     identity_dir_ = false;
};
}  // namespace

TEST_F(ConfigTest, KeyNames)
{
    EXPECT_EQ(ConfigKey(ConfigKey::PEER_LIVENESS_WINDOW).to_string(), "peer_liveness_window");
    EXPECT_EQ(ConfigKey("hash_algorithm"), ConfigKey::HASH_ALGORITHM);
    EXPECT_EQ(ConfigKey("bogus"), ConfigKey::KEY_COUNT);
}

TEST_F(ConfigTest, GetInt)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_integer(ConfigKey::LISTEN_PORT), listen_port_);
}

TEST_F(ConfigTest, GetString)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_string(ConfigKey::PEER_LIST_FILE), peer_list_file_);
}

TEST_F(ConfigTest, GetBool)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_bool(ConfigKey::REQUIRE_SIGNATURES), require_signatures_);
}

TEST_F(ConfigTest, GetFloat)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_float(ConfigKey::MIN_TRUST_SCORE), min_trust_score_);
}

TEST_F(ConfigTest, GetFloat_FromInteger)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_float(ConfigKey::ANNOUNCE_TIMEOUT), double(announce_timeout_));
}

TEST_F(ConfigTest, GetStringList)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_string_list(ConfigKey::TRACKERS), trackers_);
}

TEST_F(ConfigTest, GetMissingValue)
{
    Config conf {config_loader_, std::make_unique<GoodFallbackValueProviderMock>()};
    EXPECT_EQ(conf.get_integer(ConfigKey::DISCOVERY_TIMEOUT),
        GoodFallbackValueProviderMock::discovery_timeout_);
}

TEST_F(ConfigTest, GetMissingValue_NoFallback)
{
    Config conf {config_loader_};
    EXPECT_DEATH((void) conf.get_integer(ConfigKey::DISCOVERY_TIMEOUT), "");
}

TEST_F(ConfigTest, GetMissingValue_MissingInFallback)
{
    Config conf {config_loader_, std::make_unique<BadFallbackValueProviderMock>()};
    EXPECT_DEATH((void) conf.get_integer(ConfigKey::DISCOVERY_TIMEOUT), "");
}

TEST_F(ConfigTest, GetValue_WrongType)
{
    Config conf {config_loader_, std::make_unique<GoodFallbackValueProviderMock>()};
    EXPECT_EQ(
        conf.get_string(ConfigKey::IDENTITY_DIR), GoodFallbackValueProviderMock::identity_dir_);
}

TEST_F(ConfigTest, GetValue_WrongType_NoFallback)
{
    Config conf {config_loader_};
    EXPECT_DEATH((void) conf.get_string(ConfigKey::IDENTITY_DIR), "");
}

TEST_F(ConfigTest, GetValue_WrongType_WrongTypeInFallback)
{
    Config conf {config_loader_, std::make_unique<BadFallbackValueProviderMock2>()};
    EXPECT_DEATH((void) conf.get_string(ConfigKey::IDENTITY_DIR), "");
}
