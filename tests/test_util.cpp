#include <gtest/gtest.h>

#include "util.hpp"

#include <set>

TEST(FormatSizeTest, Bytes) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(5), "5 B");
    EXPECT_EQ(format_size(1023), "1023 B");
}

TEST(FormatSizeTest, BinaryUnits) {
    EXPECT_EQ(format_size(1024), "1.0 KiB");
    EXPECT_EQ(format_size(1536), "1.5 KiB");
    EXPECT_EQ(format_size(1024ull * 1024), "1.0 MiB");
    EXPECT_EQ(format_size(32ull * 1024 * 1024), "32.0 MiB");
    EXPECT_EQ(format_size(3ull * 1024 * 1024 * 1024), "3.0 GiB");
}

TEST(FormatSizeTest, StaysInGiBPastTerabyte) {
    EXPECT_EQ(format_size(2048ull * 1024 * 1024 * 1024), "2048.0 GiB");
}

TEST(SessionIdTest, HexAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        std::string id = generate_session_id();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 20u);
}

TEST(JoinArgsTest, Separators) {
    EXPECT_EQ(join_args({}), "");
    EXPECT_EQ(join_args({ "ssh" }), "ssh");
    EXPECT_EQ(join_args({ "ssh", "devbox", "clipwire", "paste" }), "ssh devbox clipwire paste");
    EXPECT_EQ(join_args({ "a", "b" }, ", "), "a, b");
}

TEST(BytesTest, PreservesEmbeddedNul) {
    std::string s("a\0b", 3);
    Bytes b = to_bytes(s);
    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(to_string(b), s);
}
