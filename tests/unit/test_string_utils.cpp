#include <gtest/gtest.h>
#include "sandcell/utils/string_utils.hpp"

#include <set>

namespace sandcell {
namespace utils {
namespace {

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::Trim("  hello \n\t"), "hello");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::ToLower("MiXeD"), "mixed");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    auto parts = StringUtils::Split("a,,b,c,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[2], "c");
    EXPECT_EQ(StringUtils::Join(parts, "-"), "a-b-c");
    EXPECT_EQ(StringUtils::Join({}, "-"), "");
}

TEST(StringUtilsTest, PrefixSuffixContains) {
    EXPECT_TRUE(StringUtils::StartsWith("pip install numpy", "pip"));
    EXPECT_FALSE(StringUtils::StartsWith("pi", "pip"));
    EXPECT_TRUE(StringUtils::EndsWith("/tmp/x.py", ".py"));
    EXPECT_TRUE(StringUtils::Contains("sudo apt-get install", "apt-get"));
}

TEST(StringUtilsTest, ParseBoolFallsBackOnGarbage) {
    EXPECT_TRUE(StringUtils::ParseBool("TRUE", false));
    EXPECT_TRUE(StringUtils::ParseBool(" yes ", false));
    EXPECT_FALSE(StringUtils::ParseBool("0", true));
    EXPECT_FALSE(StringUtils::ParseBool("off", true));
    EXPECT_TRUE(StringUtils::ParseBool("maybe", true));
    EXPECT_FALSE(StringUtils::ParseBool("", false));
}

TEST(StringUtilsTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(StringUtils::ShellQuote("plain"), "'plain'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(StringUtils::ShellQuote(""), "''");
}

TEST(StringUtilsTest, Base64KnownVectors) {
    EXPECT_EQ(StringUtils::ToBase64(""), "");
    EXPECT_EQ(StringUtils::ToBase64("f"), "Zg==");
    EXPECT_EQ(StringUtils::ToBase64("fo"), "Zm8=");
    EXPECT_EQ(StringUtils::ToBase64("foo"), "Zm9v");
    EXPECT_EQ(StringUtils::ToBase64("hello\n"), "aGVsbG8K");
    EXPECT_EQ(StringUtils::ToBase64("user:"), "dXNlcjo=");

    EXPECT_EQ(StringUtils::FromBase64("aGVsbG8K"), "hello\n");
    EXPECT_EQ(StringUtils::FromBase64("Zm8="), "fo");
}

TEST(StringUtilsTest, Base64HandlesLongBinaryInput) {
    std::string data;
    for (int i = 0; i < 4096; ++i) {
        data.push_back(static_cast<char>(i % 256));
    }
    EXPECT_EQ(StringUtils::FromBase64(StringUtils::ToBase64(data)), data);
}

TEST(StringUtilsTest, RandomHexIsLowercaseAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto value = StringUtils::RandomHex(12);
        ASSERT_EQ(value.size(), 12u);
        EXPECT_EQ(value.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(value);
    }
    EXPECT_EQ(seen.size(), 50u);
    EXPECT_EQ(StringUtils::RandomHex(7).size(), 7u);
}

TEST(StringUtilsTest, Truncate) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("0123456789abc", 10), "0123456...");
}

} // namespace
} // namespace utils
} // namespace sandcell
