#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "contenthasherimpl.hpp"
#include "hasherimpl.hpp"
#include "threadpool.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse::storage;
using namespace ::synapse::crypto;

namespace
{
class ContentHasherTest : public Test
{
protected:
    testutils::TempDir            temp_dir_;
    ::synapse::utils::ThreadPool  thread_pool_ {2};
    ContentHasherImpl             content_hasher_ {std::make_shared<HasherImpl>()};
};
}  // namespace

TEST_F(ContentHasherTest, HashFile)
{
    auto path = temp_dir_.file("abc.txt");
    testutils::write_file(path, "abc");

    std::string sha256;
    std::string sha1;
    auto f256 = content_hasher_.create_hash(path, HashAlgorithm::SHA256, sha256, thread_pool_);
    auto f1   = content_hasher_.create_hash(path, HashAlgorithm::SHA1, sha1, thread_pool_);

    ASSERT_EQ(f256.wait_for(std::chrono::seconds {5}), std::future_status::ready);
    ASSERT_EQ(f1.wait_for(std::chrono::seconds {5}), std::future_status::ready);
    EXPECT_TRUE(f256.get());
    EXPECT_TRUE(f1.get());
    EXPECT_EQ(sha256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha1, "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(ContentHasherTest, MissingFile)
{
    std::string hash;
    auto future = content_hasher_.create_hash(
        temp_dir_.file("missing"), HashAlgorithm::SHA256, hash, thread_pool_);
    EXPECT_FALSE(future.get());
    EXPECT_TRUE(hash.empty());
}
