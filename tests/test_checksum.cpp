#include <gtest/gtest.h>
#include <transfer/checksum.hpp>
#include <stdexcept>
#include <string>

TEST(Checksum, Crc32KnownVector) {
    Crc32Accumulator crc;
    std::string data = "123456789";
    crc.update(data.data(), data.size());
    EXPECT_EQ(crc.value(), 0xCBF43926u);
}

TEST(Checksum, Crc32Incremental) {
    Crc32Accumulator whole;
    Crc32Accumulator parts;
    std::string data = "the quick brown fox";
    whole.update(data.data(), data.size());
    parts.update(data.data(), 4);
    parts.update(data.data() + 4, data.size() - 4);
    EXPECT_EQ(whole.value(), parts.value());
}

TEST(Checksum, Sha256KnownVectors) {
    Sha256Accumulator empty;
    EXPECT_EQ(digest_to_hex(empty.finish()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Sha256Accumulator abc;
    abc.update("abc", 3);
    EXPECT_EQ(digest_to_hex(abc.finish()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Checksum, Sha256UseAfterFinishThrows) {
    Sha256Accumulator sha;
    sha.update("x", 1);
    sha.finish();
    EXPECT_THROW(sha.update("y", 1), std::logic_error);
    EXPECT_THROW(sha.finish(), std::logic_error);
}

TEST(Checksum, DigestFromHex) {
    Sha256Accumulator sha;
    sha.update("abc", 3);
    Digest256 digest = sha.finish();

    Digest256 parsed{};
    ASSERT_TRUE(digest_from_hex(digest_to_hex(digest), parsed));
    EXPECT_EQ(parsed, digest);

    EXPECT_FALSE(digest_from_hex("abcd", parsed));
    EXPECT_FALSE(digest_from_hex(std::string(64, 'g'), parsed));
}
