#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "peercache.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse::transfer;
using namespace std::chrono_literals;

namespace
{
class PeerCacheTest : public Test
{
protected:
    PeerCache cache_ {300s};
};
}  // namespace

TEST_F(PeerCacheTest, StartsEmpty)
{
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_TRUE(cache_.snapshot()->empty());
    EXPECT_EQ(cache_.liveness_window(), 300s);
}

TEST_F(PeerCacheTest, MergeKeepsNewestEntry)
{
    auto old_a = testutils::make_peer("a", 100s, 1000);
    auto new_a = testutils::make_peer("a", 10s, 2000);
    auto b     = testutils::make_peer("b");

    cache_.merge({old_a, b});
    cache_.merge({new_a});
    EXPECT_EQ(cache_.size(), 2u);

    cache_.merge({old_a});

    auto snapshot = cache_.snapshot();
    auto it       = std::find_if(snapshot->cbegin(), snapshot->cend(),
        [](const auto &p) { return p.peer_id == "a"; });
    ASSERT_NE(it, snapshot->cend());
    EXPECT_EQ(it->port, 2000);
}

TEST_F(PeerCacheTest, SnapshotIsImmutable)
{
    cache_.merge({testutils::make_peer("a")});
    auto snapshot = cache_.snapshot();

    cache_.replace({});
    EXPECT_EQ(snapshot->size(), 1u);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(PeerCacheTest, AlivePeersAndPrune)
{
    cache_.replace({testutils::make_peer("fresh", 10s), testutils::make_peer("stale", 301s),
        testutils::make_peer("edge", 300s)});

    auto alive = cache_.alive_peers();
    ASSERT_EQ(alive.size(), 1u);
    EXPECT_EQ(alive.front().peer_id, "fresh");

    EXPECT_EQ(cache_.prune(), 2u);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_EQ(cache_.prune(), 0u);
}

TEST_F(PeerCacheTest, ConcurrentReadersAndWriters)
{
    std::atomic_bool running {true};
    std::atomic_int  reads {0};

    std::thread reader {[&] {
        while (running)
        {
            auto snapshot = cache_.snapshot();
            for (const auto &peer : *snapshot)
            {
                EXPECT_FALSE(peer.peer_id.empty());
            }
            ++reads;
        }
    }};

    // Keeps writing until the reader has overlapped with the writes
    for (int i = 0; i < 200 || reads < 50; ++i)
    {
        cache_.merge({testutils::make_peer("peer" + std::to_string(i % 20))});
    }
    cache_.prune();

    running = false;
    reader.join();

    EXPECT_EQ(cache_.size(), 20u);
    EXPECT_GE(reads, 50);
}
