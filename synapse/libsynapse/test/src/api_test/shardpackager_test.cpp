#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "base64encoderimpl.hpp"
#include "contenthasherimpl.hpp"
#include "hasherimpl.hpp"
#include "jsonshardmetadatastore.hpp"
#include "shardpackager.hpp"
#include "threadpool.hpp"

#include "identity_mock.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse;
using namespace ::synapse::model;

namespace
{
class ShardPackagerTest : public Test
{
protected:
    void SetUp() override
    {
        artifact_path_ = temp_dir_.file("notes.bin");
        testutils::write_file(artifact_path_, "abc");

        options_.source_path  = artifact_path_;
        options_.display_name = "  notes  ";
        options_.entry_count  = 3;
        options_.tags         = {" docs ", "", "docs", "code"};

        ON_CALL(identity_, agent_id()).WillByDefault(Return("agent"));
        ON_CALL(identity_, public_key()).WillByDefault(Return("PEM"));
        ON_CALL(identity_, sign(_)).WillByDefault(Return(std::vector<uint8_t> {0x01, 0x02}));
    }

    testutils::TempDir                     temp_dir_;
    std::shared_ptr<utils::ThreadPool>     thread_pool_ = std::make_shared<utils::ThreadPool>(2);
    std::shared_ptr<storage::ShardMetadataStore> metadata_store_ =
        std::make_shared<storage::JSONShardMetadataStore>(
            std::make_shared<crypto::Base64EncoderImpl>());
    ShardPackager packager_ {
        std::make_shared<storage::ContentHasherImpl>(std::make_shared<crypto::HasherImpl>()),
        metadata_store_, thread_pool_, crypto::HashAlgorithm::SHA256,
        {"udp://default.example:80"}};
    NiceMock<IdentityMock> identity_;
    std::string            artifact_path_;
    ShardOptions           options_;

    static constexpr char const *abc_sha256_ =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
};
}  // namespace

TEST_F(ShardPackagerTest, CreateShard)
{
    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error)) << error.message;

    EXPECT_EQ(shard.file_path, artifact_path_);
    EXPECT_EQ(shard.display_name, "notes");
    EXPECT_EQ(shard.embedding_model, ShardOptions::default_embedding_model);
    EXPECT_EQ(shard.dimensions, ShardOptions::default_dimensions);
    EXPECT_EQ(shard.entry_count, 3u);
    EXPECT_EQ(shard.tags, (std::set<std::string> {"code", "docs"}));
    EXPECT_EQ(shard.content_hash, abc_sha256_);
    EXPECT_FALSE(shard.is_signed());

    Shard loaded;
    ASSERT_TRUE(packager_.load_shard(artifact_path_, loaded, error));
    EXPECT_EQ(loaded.content_hash, abc_sha256_);
    EXPECT_EQ(loaded.display_name, "notes");
}

TEST_F(ShardPackagerTest, CreateShard_NameDefaultsToFileName)
{
    options_.display_name = " ";

    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error));
    EXPECT_EQ(shard.display_name, "notes.bin");
}

TEST_F(ShardPackagerTest, CreateShard_MissingSource)
{
    options_.source_path = temp_dir_.file("missing.bin");

    Shard shard;
    Error error;
    EXPECT_FALSE(packager_.create_shard(options_, shard, error));
    EXPECT_EQ(error.code, ErrorCode::NOT_FOUND);
    EXPECT_FALSE(std::filesystem::exists(metadata_store_->metadata_path(options_.source_path)));
}

TEST_F(ShardPackagerTest, ComputeHash_DetectsModifiedArtifact)
{
    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error));
    EXPECT_TRUE(packager_.compute_hash(shard, error));

    testutils::write_file(artifact_path_, "abd");
    EXPECT_FALSE(packager_.compute_hash(shard, error));
    EXPECT_EQ(error.code, ErrorCode::INTEGRITY);
}

TEST_F(ShardPackagerTest, DeriveLink)
{
    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error));

    auto link = packager_.derive_link(shard, {}, error);
    ASSERT_TRUE(link);
    EXPECT_EQ(link->content_hash, abc_sha256_);
    EXPECT_EQ(link->display_name, "notes");
    EXPECT_EQ(link->file_size, 3u);
    EXPECT_EQ(link->trackers, std::vector<std::string> {"udp://default.example:80"});
    EXPECT_EQ(link->embedding_model, shard.embedding_model);
    EXPECT_EQ(link->dimensions, shard.dimensions);
    EXPECT_EQ(link->tags, shard.tags);

    link = packager_.derive_link(shard, {"udp://custom.example:1"}, error);
    ASSERT_TRUE(link);
    EXPECT_EQ(link->trackers, std::vector<std::string> {"udp://custom.example:1"});
}

TEST_F(ShardPackagerTest, DeriveLink_HashesLazily)
{
    Shard shard;
    shard.file_path    = artifact_path_;
    shard.display_name = "notes";

    Error error;
    auto  link = packager_.derive_link(shard, {}, error);
    ASSERT_TRUE(link);
    EXPECT_EQ(shard.content_hash, abc_sha256_);

    Shard loaded;
    ASSERT_TRUE(packager_.load_shard(artifact_path_, loaded, error));
    EXPECT_EQ(loaded.content_hash, abc_sha256_);
}

TEST_F(ShardPackagerTest, DeriveLink_MissingArtifact)
{
    Shard shard;
    shard.file_path = temp_dir_.file("missing.bin");

    Error error;
    EXPECT_FALSE(packager_.derive_link(shard, {}, error));
    EXPECT_EQ(error.code, ErrorCode::NOT_FOUND);
}

TEST_F(ShardPackagerTest, SignShard)
{
    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error));

    EXPECT_CALL(identity_, sign(shard.signed_payload() + "agent"))
        .WillOnce(Return(std::vector<uint8_t> {0x0a}));
    ASSERT_TRUE(packager_.sign_shard(shard, identity_, error));

    EXPECT_EQ(shard.creator_id, "agent");
    EXPECT_EQ(shard.creator_public_key, "PEM");
    EXPECT_EQ(shard.signature, std::vector<uint8_t> {0x0a});

    Shard loaded;
    ASSERT_TRUE(packager_.load_shard(artifact_path_, loaded, error));
    EXPECT_EQ(loaded.creator_id, "agent");
    EXPECT_EQ(loaded.signature, std::vector<uint8_t> {0x0a});
}

TEST_F(ShardPackagerTest, SignShard_SigningFails)
{
    Shard shard;
    Error error;
    ASSERT_TRUE(packager_.create_shard(options_, shard, error));

    ON_CALL(identity_, sign(_)).WillByDefault(Return(std::vector<uint8_t> {}));
    EXPECT_FALSE(packager_.sign_shard(shard, identity_, error));
    EXPECT_EQ(error.code, ErrorCode::SIGNATURE);
    EXPECT_FALSE(shard.is_signed());
}
