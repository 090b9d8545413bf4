#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace mdeploy {

TEST(Sha256Test, KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    testutil::MemorySource reader(std::string("abc"));
    EXPECT_EQ(Sha256Hex(reader), expected);
    EXPECT_EQ(Sha256Hex(std::string_view("abc")), expected);
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::string_view{}),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const std::string data(100000, 'x');
    Sha256Hasher h;
    for (size_t off = 0; off < data.size(); off += 777) {
        const size_t n = std::min<size_t>(777, data.size() - off);
        h.Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data() + off), n));
    }
    EXPECT_EQ(h.FinalHex(), Sha256Hex(std::string_view(data)));
}

TEST(Sha256Test, FileDigestAndMissingFile) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "f", "abc");
    auto d = Sha256OfFile((tmp / "f").string());
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(*d, Sha256Hex(std::string_view("abc")));

    auto missing = Sha256OfFile((tmp / "nope").string());
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("nope"), std::string::npos);
}

} // namespace mdeploy
