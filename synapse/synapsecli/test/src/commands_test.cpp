#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "attestcommand.hpp"
#include "createshardcommand.hpp"
#include "downloadcommand.hpp"
#include "generatelinkcommand.hpp"
#include "jsonformat.hpp"
#include "keygencommand.hpp"
#include "listseedscommand.hpp"
#include "signcommand.hpp"
#include "simulatedtransferengine.hpp"
#include "synapsenode.hpp"
#include "verifycommand.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapsecli;
using namespace ::synapse::model;

namespace
{
class CommandsTest : public Test
{
protected:
    void SetUp() override
    {
        testutils::write_file(
            temp_dir_.file("peers.txt"), "# static peers\npeer1 127.0.0.1 6881\n");
        testutils::write_file(temp_dir_.file("vectors.db"), std::string(5000, 'v'));
        node_ = std::make_unique<synapse::SynapseNode>(temp_dir_.path().string(), "config.json",
            std::make_shared<SimulatedTransferEngine>(1024));
    }

    void TearDown() override
    {
        node_->shutdown();
    }

    nlohmann::json create_shard()
    {
        synapse::ShardOptions options;
        options.source_path  = temp_dir_.file("vectors.db");
        options.display_name = "Project notes";
        options.tags         = {"notes"};

        nlohmann::json result;
        Error          error;
        EXPECT_TRUE(CreateShardCommand {options}.execute(*node_, result, error)) << error.message;
        return result;
    }

    testutils::TempDir                    temp_dir_;
    std::unique_ptr<synapse::SynapseNode> node_;
};
}  // namespace

TEST_F(CommandsTest, CreateShard)
{
    auto result = create_shard();
    EXPECT_EQ(result.at("shard").at("display_name"), "Project notes");
    EXPECT_EQ(result.at("shard").at("content_hash").get<std::string>().size(), 64u);
    EXPECT_EQ(result.at("shard").at("signed"), false);
    EXPECT_TRUE(std::filesystem::exists(temp_dir_.file("vectors.db.meta.json")));
}

TEST_F(CommandsTest, CreateShard_MissingSource)
{
    synapse::ShardOptions options;
    options.source_path  = temp_dir_.file("missing.db");
    options.display_name = "x";

    nlohmann::json result;
    Error          error;
    EXPECT_FALSE(CreateShardCommand {options}.execute(*node_, result, error));
    EXPECT_EQ(error.code, ErrorCode::NOT_FOUND);
}

TEST_F(CommandsTest, GenerateLinkThenDownload)
{
    create_shard();

    nlohmann::json link_result;
    Error          error;
    ASSERT_TRUE(GenerateLinkCommand(temp_dir_.file("vectors.db"), {"udp://tracker.example:80"})
                    .execute(*node_, link_result, error))
        << error.message;
    EXPECT_EQ(link_result.at("trackers").size(), 1u);
    auto uri = link_result.at("link").get<std::string>();

    ListSeedsCommand list_seeds;
    nlohmann::json   seeds;
    ASSERT_TRUE(list_seeds.execute(*node_, seeds, error));
    EXPECT_EQ(seeds.at("count"), 1u);

    // A second node plays the downloading side
    testutils::TempDir   downloader_dir;
    synapse::SynapseNode downloader {downloader_dir.path().string(), "config.json",
        std::make_shared<SimulatedTransferEngine>(1024)};
    testutils::write_file(downloader_dir.file("peers.txt"), "peer1 127.0.0.1 6881\n");

    std::ostringstream progress;
    nlohmann::json     download_result;
    ASSERT_TRUE(DownloadCommand(uri, downloader_dir.file("out"), progress)
                    .execute(downloader, download_result, error))
        << error.message;

    auto file_path = download_result.at("file_path").get<std::string>();
    EXPECT_EQ(std::filesystem::path {file_path}.filename(), "Project notes");
    EXPECT_EQ(std::filesystem::file_size(file_path), 5000u);
    EXPECT_EQ(download_result.at("session").at("status"), "seeding");
    EXPECT_NE(progress.str().find("100%"), std::string::npos);
    downloader.shutdown();
}

TEST_F(CommandsTest, DownloadWithoutPeers)
{
    create_shard();

    nlohmann::json link_result;
    Error          error;
    ASSERT_TRUE(
        GenerateLinkCommand(temp_dir_.file("vectors.db"), {}).execute(*node_, link_result, error));

    testutils::TempDir   downloader_dir;
    synapse::SynapseNode downloader {downloader_dir.path().string(), "config.json",
        std::make_shared<SimulatedTransferEngine>()};

    std::ostringstream progress;
    nlohmann::json     result;
    DownloadCommand download {link_result.at("link").get<std::string>(), "", progress};
    EXPECT_FALSE(download.execute(downloader, result, error));
    EXPECT_EQ(error.code, ErrorCode::NO_PEERS);
    downloader.shutdown();
}

TEST_F(CommandsTest, DownloadInvalidLink)
{
    std::ostringstream progress;
    nlohmann::json     result;
    Error              error;
    DownloadCommand download {"http://example.com", "", progress};
    EXPECT_FALSE(download.execute(*node_, result, error));
    EXPECT_EQ(error.code, ErrorCode::FORMAT);
}

TEST_F(CommandsTest, KeygenSignVerify)
{
    create_shard();

    nlohmann::json keygen_result;
    Error          error;
    ASSERT_TRUE(KeygenCommand {false}.execute(*node_, keygen_result, error)) << error.message;
    auto agent_id = keygen_result.at("agent_id").get<std::string>();
    EXPECT_EQ(agent_id.size(), 16u);

    nlohmann::json again;
    EXPECT_FALSE(KeygenCommand {false}.execute(*node_, again, error));

    nlohmann::json sign_result;
    ASSERT_TRUE(SignCommand {temp_dir_.file("vectors.db")}.execute(*node_, sign_result, error))
        << error.message;
    EXPECT_EQ(sign_result.at("shard").at("signed"), true);
    EXPECT_EQ(sign_result.at("shard").at("creator_id"), agent_id);

    // The new agent has no reputation yet
    VerifyCommand  verify {temp_dir_.file("vectors.db")};
    nlohmann::json verify_result;
    EXPECT_FALSE(verify.execute(*node_, verify_result, error));
    EXPECT_EQ(error.code, ErrorCode::TRUST_REJECTED);
    EXPECT_EQ(verify_result.at("checks").at("integrity"), true);
    EXPECT_EQ(verify_result.at("checks").at("signature"), true);
    EXPECT_EQ(verify_result.at("checks").at("reputation"), false);

    testutils::write_file(temp_dir_.file("trust_scores.json"), "{\"" + agent_id + "\": 0.8}");
    verify_result = nlohmann::json::object();
    EXPECT_TRUE(verify.execute(*node_, verify_result, error)) << error.message;
}

TEST_F(CommandsTest, VerifyModifiedArtifact)
{
    create_shard();
    testutils::write_file(temp_dir_.file("vectors.db"), std::string(5000, 'w'));

    nlohmann::json result;
    Error          error;
    EXPECT_FALSE(VerifyCommand {temp_dir_.file("vectors.db")}.execute(*node_, result, error));
    EXPECT_EQ(error.code, ErrorCode::INTEGRITY);
}

TEST_F(CommandsTest, Attest)
{
    create_shard();

    nlohmann::json result;
    Error          error;
    AttestCommand anonymous {temp_dir_.file("vectors.db"), 0.5, ""};
    EXPECT_FALSE(anonymous.execute(*node_, result, error));
    EXPECT_EQ(error.code, ErrorCode::NOT_FOUND);

    nlohmann::json keygen_result;
    ASSERT_TRUE(KeygenCommand {false}.execute(*node_, keygen_result, error));

    ASSERT_TRUE(AttestCommand(temp_dir_.file("vectors.db"), 0.5, "solid")
                    .execute(*node_, result, error))
        << error.message;
    EXPECT_EQ(result.at("attestation").at("rating"), 0.5);
    EXPECT_EQ(result.at("attestation").at("feedback"), "solid");
    EXPECT_EQ(result.at("attestation").at("consumer_agent_id"), keygen_result.at("agent_id"));
}

TEST(JSONFormatTest, Documents)
{
    Error error;
    error.set(ErrorCode::NO_PEERS, "No peers found");

    auto error_document = make_error_document(error);
    EXPECT_EQ(error_document.at("status"), "error");
    EXPECT_EQ(error_document.at("error"), "No peers found");
    EXPECT_EQ(error_document.at("code"), "NO_PEERS");

    auto success_document = make_success_document({{"count", 2}});
    EXPECT_EQ(success_document.at("status"), "success");
    EXPECT_EQ(success_document.at("count"), 2);
}
