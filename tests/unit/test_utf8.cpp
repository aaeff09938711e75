#include <string>
#include <gtest/gtest.h>
#include "core/text/utf8.hpp"

namespace {

using shellserver::core::text::sanitize_utf8;

const std::string kReplacement = "\xEF\xBF\xBD";

TEST(Utf8Test, KeepsAsciiAndValidMultibyte) {
    const std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    EXPECT_EQ(sanitize_utf8(text), text);
}

TEST(Utf8Test, ReplacesStrayContinuationByte) {
    EXPECT_EQ(sanitize_utf8("a\x80" "b"), "a" + kReplacement + "b");
}

TEST(Utf8Test, ReplacesTruncatedSequenceAtEnd) {
    EXPECT_EQ(sanitize_utf8("ok\xE2\x82"), "ok" + kReplacement);
}

TEST(Utf8Test, ReplacesOverlongAndSurrogateEncodings) {
    EXPECT_EQ(sanitize_utf8("\xC0\xAF"), kReplacement + kReplacement);
    EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), kReplacement + kReplacement + kReplacement);
}

TEST(Utf8Test, ResumesAfterInvalidContinuation) {
    // The 'A' that breaks the sequence is kept.
    EXPECT_EQ(sanitize_utf8("\xE2" "A"), kReplacement + "A");
}

TEST(Utf8Test, KeepsEmbeddedNul) {
    const std::string text("a\0b", 3);
    EXPECT_EQ(sanitize_utf8(text), text);
}

}  // namespace
