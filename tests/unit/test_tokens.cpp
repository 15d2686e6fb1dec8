#include <gtest/gtest.h>
#include "tokens.hpp"

using namespace strata;

namespace {

TEST(TokensTest, EstimateRoundsUp) {
    EXPECT_EQ(estimate_tokens(std::string()), 0);
    EXPECT_EQ(estimate_tokens(std::string("a")), 1);
    EXPECT_EQ(estimate_tokens(std::string("abcd")), 1);
    EXPECT_EQ(estimate_tokens(std::string("abcde")), 2);
    EXPECT_EQ(estimate_tokens(std::string(400, 'x')), 100);
}

TEST(TokensTest, EstimateCountsCodepoints) {
    // Four two-byte codepoints
    EXPECT_EQ(estimate_tokens(std::string("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9")), 1);
}

TEST(TokensTest, MessageEstimateIncludesToolCalls) {
    Message m = make_message("assistant", "abcd");
    EXPECT_EQ(estimate_tokens(m), 5);
    m.tool_calls.push_back(ToolCall{"id1", "shell", "{\"command\":\"ls\"}"});
    EXPECT_GT(estimate_tokens(m), 5 + 8);
}

TEST(TokensTest, ShortTextUntouched) {
    std::string text = "short text";
    EXPECT_EQ(truncate_to_tokens(text, 100, false), text);
    EXPECT_EQ(truncate_to_tokens(text, 0, false), text);
}

TEST(TokensTest, TruncatedTextFitsBudgetAndCarriesMarker) {
    std::string text;
    for (int i = 0; i < 5000; i++) text += "line " + std::to_string(i) + " of output\n";
    int total = estimate_tokens(text);
    ASSERT_GT(total, 20000);

    for (bool tail : {false, true}) {
        std::string out = truncate_to_tokens(text, 2000, tail);
        EXPECT_LE(estimate_tokens(out), 2000);
        EXPECT_NE(out.find("[truncated "), std::string::npos);
        EXPECT_EQ(out.rfind("line 0 of output", 0), 0u);
        if (tail) EXPECT_NE(out.find("line 4999 of output"), std::string::npos);
    }
}

TEST(TokensTest, TruncationKeepsUtf8Intact) {
    std::string text;
    for (int i = 0; i < 2000; i++) text += "\xE4\xB8\xAD";
    std::string out = truncate_to_tokens(text, 50, true);
    EXPECT_LE(estimate_tokens(out), 50);
    // Every byte sequence still decodes to whole codepoints
    size_t marker = out.find("[truncated");
    ASSERT_NE(marker, std::string::npos);
    std::string head = out.substr(0, out.find('\n'));
    EXPECT_EQ(head.size() % 3, 0u);
}

} // namespace
