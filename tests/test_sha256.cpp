#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace repack {

namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

TEST(Sha256Test, KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    EXPECT_EQ(Sha256Hex(Bytes("abc")), expected);
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    Sha256Hasher hasher;
    hasher.Update(Bytes("a"));
    hasher.Update(Bytes("bc"));
    EXPECT_EQ(hasher.FinalHex(), Sha256Hex(Bytes("abc")));
}

TEST(Sha256Test, HashesFileContents) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("data.bin");
    std::vector<std::uint8_t> data(200 * 1024);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::uint8_t>(i * 31);
    ASSERT_TRUE(testutil::WriteBytesFile(path, data));

    std::string hex;
    ASSERT_TRUE(Sha256HexFile(path, hex).is_ok());
    EXPECT_EQ(hex, Sha256Hex(std::span<const std::uint8_t>(data.data(), data.size())));

    std::string missing;
    EXPECT_FALSE(Sha256HexFile(tmp.Join("missing.bin"), missing).is_ok());
}

} // namespace repack
