/*
 * Segmenter tests - Permitter
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <gtest/gtest.h>
#include <permitter/lex/lexer.hpp>
#include <permitter/parse/segmenter.hpp>

using namespace permitter;

static std::vector<Segment> segments_of(const std::string& line) {
    auto r = tokenize(line);
    EXPECT_FALSE(is_error(r)) << line;
    if (is_error(r)) return {};
    return segment_tokens(get_value(r));
}

TEST(SegmenterBasic, AndOrList) {
    auto segs = segments_of("cd /tmp && echo ok || echo fail; pwd");
    ASSERT_EQ(segs.size(), 4u);
    EXPECT_EQ(join_tokens(segs[0].tokens), "cd /tmp");
    EXPECT_EQ(segs[0].next, ChainOp::And);
    EXPECT_EQ(segs[1].next, ChainOp::Or);
    EXPECT_EQ(segs[2].next, ChainOp::Seq);
    EXPECT_EQ(join_tokens(segs[3].tokens), "pwd");
    EXPECT_EQ(segs[3].next, ChainOp::None);
}

TEST(SegmenterBasic, PipelineCount) {
    auto segs = segments_of("echo a | grep a | wc -l");
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].next, ChainOp::Pipe);
    EXPECT_EQ(segs[1].next, ChainOp::Pipe);
}

TEST(SegmenterBasic, NewlineSeparates) {
    auto segs = segments_of("git status\nrm -rf /");
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].next, ChainOp::Seq);
    EXPECT_EQ(join_tokens(segs[1].tokens), "rm -rf /");
}

TEST(SegmenterBasic, EmptySegmentsDropped) {
    auto segs = segments_of("; ls ;\n\n; pwd ;");
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(join_tokens(segs[0].tokens), "ls");
    EXPECT_EQ(join_tokens(segs[1].tokens), "pwd");
    EXPECT_EQ(segs[1].next, ChainOp::None);
}

TEST(SegmenterBackground, TrailingAmpersandStaysInSegment) {
    auto segs = segments_of("npm start &");
    ASSERT_EQ(segs.size(), 1u);
    ASSERT_EQ(segs[0].tokens.size(), 3u);
    EXPECT_EQ(segs[0].tokens.back().kind, TokenKind::Background);
    EXPECT_EQ(segs[0].next, ChainOp::None);
}

TEST(SegmenterBackground, InnerAmpersandSeparates) {
    auto segs = segments_of("npm start & npm test");
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].next, ChainOp::Background);
    EXPECT_EQ(join_tokens(segs[0].tokens), "npm start");
    EXPECT_EQ(join_tokens(segs[1].tokens), "npm test");
}

TEST(SegmenterBasic, JoinCanonicalizesSpacing) {
    auto segs = segments_of("  git   commit\t-m   'a  b'  ");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(join_tokens(segs[0].tokens), "git commit -m 'a  b'");
}

TEST(SegmenterBasic, EmptyInput) {
    EXPECT_TRUE(segments_of("").empty());
    EXPECT_TRUE(segments_of("   \t ").empty());
}

TEST(SegmenterNames, ChainOpNames) {
    EXPECT_STREQ(to_string(ChainOp::And), "AND");
    EXPECT_STREQ(to_string(ChainOp::Pipe), "PIPE");
    EXPECT_STREQ(to_string(ChainOp::None), "NONE");
}
