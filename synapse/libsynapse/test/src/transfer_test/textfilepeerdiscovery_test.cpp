#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "link.hpp"
#include "textfilepeerdiscovery.hpp"
#include "threadpool.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse::transfer;

namespace
{
class TextFilePeerDiscoveryTest : public Test
{
protected:
    void SetUp() override
    {
        link_.content_hash = "a9993e364706816aba3e25717850c26c9cd0d89d";
        link_.display_name = "notes";
    }

    testutils::TempDir                            temp_dir_;
    std::shared_ptr<::synapse::utils::ThreadPool> thread_pool_ =
        std::make_shared<::synapse::utils::ThreadPool>(2);
    ::synapse::model::Link link_;
};
}  // namespace

TEST_F(TextFilePeerDiscoveryTest, ParsesPeerList)
{
    auto path = temp_dir_.file("peers.txt");
    testutils::write_file(path,
        "# id address port\n"
        "peer-1 10.0.0.1 6881\n"
        "\n"
        "peer-2 10.0.0.2 7000\n"
        "broken-line\n"
        "peer-3 10.0.0.3 99999\n");

    TextFilePeerDiscovery discovery {path, thread_pool_};
    auto                  future = discovery.discover_peers(link_);
    ASSERT_EQ(future.wait_for(std::chrono::seconds {5}), std::future_status::ready);

    auto peers = future.get();
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_EQ(peers[0].peer_id, "peer-1");
    EXPECT_EQ(peers[0].address, "10.0.0.1");
    EXPECT_EQ(peers[0].port, 6881);
    EXPECT_EQ(peers[1].peer_id, "peer-2");
    EXPECT_TRUE(peers[1].is_alive());
}

TEST_F(TextFilePeerDiscoveryTest, MissingListYieldsNoPeers)
{
    TextFilePeerDiscovery discovery {temp_dir_.file("missing.txt"), thread_pool_};
    EXPECT_TRUE(discovery.discover_peers(link_).get().empty());
    EXPECT_TRUE(discovery.refresh({}).get().empty());
}

TEST_F(TextFilePeerDiscoveryTest, AnnounceSucceeds)
{
    TextFilePeerDiscovery discovery {temp_dir_.file("peers.txt"), thread_pool_};
    EXPECT_TRUE(discovery.announce(link_, "udp://tracker.example:80").get());
}
