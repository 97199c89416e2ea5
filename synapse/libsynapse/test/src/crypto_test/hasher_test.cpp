#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "hashalgorithm.hpp"
#include "hasherimpl.hpp"
#include "hexencoding.hpp"

using namespace ::testing;
using namespace ::synapse::crypto;
using ::synapse::utils::to_hex;

namespace
{
class HasherTest : public Test
{
protected:
    std::vector<Hasher::Byte> hash_string(HashAlgorithm algorithm, const std::string &str)
    {
        return hasher_.digest(
            algorithm, reinterpret_cast<const Hasher::Byte *>(str.data()), str.size());
    }

    HasherImpl hasher_;

    static constexpr char const *abc_sha1_ = "a9993e364706816aba3e25717850c26c9cd0d89d";
    static constexpr char const *abc_sha256_ =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    static constexpr char const *empty_sha256_ =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
};
}  // namespace

TEST_F(HasherTest, SHA1)
{
    EXPECT_EQ(to_hex(hash_string(HashAlgorithm::SHA1, "abc")), abc_sha1_);
}

TEST_F(HasherTest, SHA256)
{
    EXPECT_EQ(to_hex(hash_string(HashAlgorithm::SHA256, "abc")), abc_sha256_);
}

TEST_F(HasherTest, SHA256_Empty)
{
    EXPECT_EQ(to_hex(hash_string(HashAlgorithm::SHA256, "")), empty_sha256_);
}

TEST_F(HasherTest, StreamMatchesBuffer)
{
    // Larger than one read block
    std::string data(200 * 1024, 'x');
    for (size_t i = 0; i != data.size(); ++i)
    {
        data[i] = char(i * 31);
    }

    std::istringstream is {data};
    EXPECT_EQ(hasher_.digest(HashAlgorithm::SHA256, is), hash_string(HashAlgorithm::SHA256, data));

    std::istringstream is_sha1 {data};
    EXPECT_EQ(hasher_.hash(SHA1, is_sha1), hash_string(HashAlgorithm::SHA1, data));
}

TEST_F(HasherTest, AlgorithmFromHexLength)
{
    EXPECT_EQ(algorithm_for_hex_length(40), HashAlgorithm::SHA1);
    EXPECT_EQ(algorithm_for_hex_length(64), HashAlgorithm::SHA256);
    EXPECT_FALSE(algorithm_for_hex_length(32).has_value());
    EXPECT_EQ(hex_digest_length(HashAlgorithm::SHA1), 40u);
    EXPECT_EQ(hex_digest_length(HashAlgorithm::SHA256), 64u);
}

TEST_F(HasherTest, AlgorithmNames)
{
    EXPECT_EQ(to_string(HashAlgorithm::SHA256), "sha256");
    EXPECT_EQ(parse_hash_algorithm("sha1"), HashAlgorithm::SHA1);
    EXPECT_FALSE(parse_hash_algorithm("md5").has_value());
}
