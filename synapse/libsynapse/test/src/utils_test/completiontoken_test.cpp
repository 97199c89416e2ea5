#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>

#include "completiontoken.hpp"

using namespace ::testing;
using namespace ::synapse::utils;

namespace
{
class CompletionTokenTest : public Test
{
};
}  // namespace

TEST_F(CompletionTokenTest, WaitForCompletion)
{
    CompletionToken token;
    bool            executed = false;

    std::thread t {[&executed, token]() {
        executed = true;
        token.complete();
    }};

    token.wait_for_completion();
    EXPECT_TRUE(executed);
    EXPECT_TRUE(token.is_completed());
    t.join();
}

TEST_F(CompletionTokenTest, Cancel)
{
    CompletionToken token;
    bool            executed = false;
    std::mutex      m;

    std::unique_lock l {m};

    std::thread t {[&executed, &m, token]() {
        {
            std::lock_guard l {m};
        }

        if (token.is_cancelled())
        {
            token.complete();
            return;
        }

        executed = true;
        token.complete();
    }};

    token.cancel();
    l.unlock();

    token.wait_for_completion();
    EXPECT_FALSE(executed);
    t.join();
}

TEST_F(CompletionTokenTest, WaitWithTimeout)
{
    CompletionToken token;
    EXPECT_FALSE(token.wait_for_completion(std::chrono::milliseconds {10}));

    token.complete();
    EXPECT_TRUE(token.wait_for_completion(std::chrono::milliseconds {10}));
}

TEST_F(CompletionTokenTest, CompleteIsIdempotent)
{
    CompletionToken token;
    token.complete();
    token.complete();
    EXPECT_TRUE(token.is_completed());
    EXPECT_FALSE(token.is_cancelled());
}

TEST_F(CompletionTokenTest, CopiesShareState)
{
    CompletionToken token;
    CompletionToken copy {token};
    CompletionToken other;

    EXPECT_TRUE(copy == token);
    EXPECT_FALSE(other == token);

    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_FALSE(other.is_cancelled());
}
