#include <gtest/gtest.h>

#include <string>

#include "session.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse::transfer;

namespace
{
class SessionTest : public Test
{
protected:
    const std::string hash_ = "a9993e364706816aba3e25717850c26c9cd0d89d";
};
}  // namespace

TEST_F(SessionTest, Seed)
{
    auto session = Session::create_for_seed(hash_, "/data/notes.bin", 1000);

    EXPECT_EQ(session->status(), Session::Status::SEEDING);
    EXPECT_EQ(session->downloaded(), 1000u);
    EXPECT_DOUBLE_EQ(session->progress(), 100.0);
    EXPECT_TRUE(session->is_complete());
    EXPECT_TRUE(session->snapshot().completed_at.has_value());
}

TEST_F(SessionTest, DownloadProgress)
{
    auto session = Session::create_for_download(hash_, "/data/notes.bin", 1000);

    EXPECT_EQ(session->status(), Session::Status::DOWNLOADING);
    EXPECT_DOUBLE_EQ(session->progress(), 0.0);

    EXPECT_TRUE(session->add_downloaded(250));
    EXPECT_DOUBLE_EQ(session->progress(), 25.0);

    // Never more than the total
    EXPECT_TRUE(session->add_downloaded(5000));
    EXPECT_EQ(session->downloaded(), 1000u);
    EXPECT_DOUBLE_EQ(session->progress(), 100.0);
    EXPECT_FALSE(session->is_complete());

    EXPECT_TRUE(session->complete());
    EXPECT_EQ(session->status(), Session::Status::SEEDING);
    EXPECT_TRUE(session->is_complete());
    EXPECT_FALSE(session->add_downloaded(1));
}

TEST_F(SessionTest, CompleteRequiresAllBytes)
{
    auto session = Session::create_for_download(hash_, "/data/notes.bin", 1000);
    session->add_downloaded(999);
    EXPECT_FALSE(session->complete());
    EXPECT_EQ(session->status(), Session::Status::DOWNLOADING);
}

TEST_F(SessionTest, ShareRatio)
{
    auto session = Session::create_for_download(hash_, "/data/notes.bin", 1000);
    EXPECT_DOUBLE_EQ(session->share_ratio(), 0.0);

    session->add_downloaded(500);
    session->add_uploaded(250);
    EXPECT_DOUBLE_EQ(session->share_ratio(), 0.5);
}

TEST_F(SessionTest, PauseCancelsToken)
{
    auto session = Session::create_for_seed(hash_, "/data/notes.bin", 1000);
    EXPECT_FALSE(session->completion_token().is_cancelled());

    EXPECT_TRUE(session->pause());
    EXPECT_EQ(session->status(), Session::Status::PAUSED);
    EXPECT_TRUE(session->completion_token().is_cancelled());
    EXPECT_FALSE(session->add_uploaded(1));

    EXPECT_FALSE(session->pause());
    EXPECT_FALSE(session->fail("late"));
    EXPECT_EQ(session->status(), Session::Status::PAUSED);
}

TEST_F(SessionTest, Fail)
{
    auto session = Session::create_for_download(hash_, "/data/notes.bin", 1000);

    EXPECT_TRUE(session->fail("No peers found"));
    EXPECT_EQ(session->status(), Session::Status::ERROR);
    EXPECT_EQ(session->error_message(), "No peers found");
    EXPECT_TRUE(session->completion_token().is_cancelled());

    EXPECT_FALSE(session->fail("again"));
    EXPECT_EQ(session->error_message(), "No peers found");
    EXPECT_FALSE(session->pause());
}

TEST_F(SessionTest, Snapshot)
{
    auto session = Session::create_for_download(hash_, "/data/notes.bin", 200);
    session->set_peers({testutils::make_peer("a"), testutils::make_peer("b")});
    session->add_downloaded(50);

    auto status = session->snapshot();
    EXPECT_EQ(status.content_hash, hash_);
    EXPECT_EQ(status.file_path, "/data/notes.bin");
    EXPECT_EQ(status.status, SessionStatus::Status::DOWNLOADING);
    EXPECT_DOUBLE_EQ(status.progress, 25.0);
    EXPECT_EQ(status.peer_count, 2u);
    EXPECT_EQ(status.total_size, 200u);
    EXPECT_FALSE(status.completed_at.has_value());
    EXPECT_FALSE(status.error.has_value());
}

TEST_F(SessionTest, StatusNames)
{
    EXPECT_EQ(to_string(SessionStatus::Status::IDLE), "idle");
    EXPECT_EQ(to_string(SessionStatus::Status::DOWNLOADING), "downloading");
    EXPECT_EQ(to_string(SessionStatus::Status::SEEDING), "seeding");
    EXPECT_EQ(to_string(SessionStatus::Status::PAUSED), "paused");
    EXPECT_EQ(to_string(SessionStatus::Status::ERROR), "error");
}
