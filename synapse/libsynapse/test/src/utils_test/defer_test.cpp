#include <gtest/gtest.h>

#include <string>

#include "defer.hpp"

using namespace ::testing;
using namespace ::synapse::utils;

namespace
{
class DeferTest : public Test
{
};
}  // namespace

TEST_F(DeferTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        DEFER(++calls);
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(DeferTest, RunsInReverseOrder)
{
    std::string order;
    {
        DEFER(order += "a");
        DEFER(order += "b");
    }
    EXPECT_EQ(order, "ba");
}

TEST_F(DeferTest, Dismiss)
{
    int calls = 0;
    {
        auto guard = make_scope_exit([&] { ++calls; });
        guard.dismiss();
    }
    EXPECT_EQ(calls, 0);
}
