/**
 * media_type_test.cpp - Media types, Accept parsing and negotiation
 */

#include "content/media_type.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace opr::content;

namespace {
MediaType type_of(const std::string &text) {
    MediaType media_type;
    std::string error;
    EXPECT_TRUE(MediaType::parse(text, media_type, error)) << error;
    return media_type;
}

std::vector<MediaRange> accept(const std::string &header) {
    std::vector<MediaRange> ranges;
    std::string error;
    EXPECT_TRUE(parse_accept(header, ranges, error)) << error;
    return ranges;
}
}  // namespace

TEST(MediaTypeTest, ParsesAndLowercases) {
    MediaType media_type = type_of("Text/HTML; Charset=utf-8");
    EXPECT_EQ(media_type.type, "text");
    EXPECT_EQ(media_type.subtype, "html");
    ASSERT_EQ(media_type.parameters.size(), 1u);
    EXPECT_EQ(media_type.parameters[0].first, "charset");
    EXPECT_EQ(media_type.parameters[0].second, "utf-8");
    EXPECT_EQ(media_type.to_string(), "text/html; charset=utf-8");
    EXPECT_EQ(media_type.essence(), "text/html");
}

TEST(MediaTypeTest, EqualityIgnoresParameters) {
    EXPECT_EQ(type_of("text/html"), type_of("text/html; charset=utf-8"));
    EXPECT_NE(type_of("text/html"), type_of("text/plain"));
}

TEST(MediaTypeTest, RejectsMalformedAndWildcards) {
    MediaType media_type;
    std::string error;
    EXPECT_FALSE(MediaType::parse("texthtml", media_type, error));
    EXPECT_FALSE(MediaType::parse("text/", media_type, error));
    EXPECT_FALSE(MediaType::parse("text/html; charset", media_type, error));
    EXPECT_FALSE(MediaType::parse("text/*", media_type, error));
    EXPECT_FALSE(MediaType::parse("*/*", media_type, error));
}

TEST(MediaTypeTest, RangeQuality) {
    MediaRange range;
    std::string error;
    ASSERT_TRUE(MediaRange::parse("text/*;q=0.5", range, error)) << error;
    EXPECT_EQ(range.type, "text");
    EXPECT_EQ(range.subtype, "*");
    EXPECT_DOUBLE_EQ(range.quality, 0.5);
    EXPECT_TRUE(range.parameters.empty());
    EXPECT_EQ(range.to_string(), "text/*;q=0.5");

    EXPECT_FALSE(MediaRange::parse("text/html;q=abc", range, error));
    EXPECT_FALSE(MediaRange::parse("*/html", range, error));
}

TEST(MediaTypeTest, AcceptSortsByQualityAndDropsZero) {
    auto ranges = accept("text/plain;q=0.5, application/json, image/png;q=0, text/html;q=0.8");
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].subtype, "json");
    EXPECT_EQ(ranges[1].subtype, "html");
    EXPECT_EQ(ranges[2].subtype, "plain");
}

TEST(MediaTypeTest, EmptyAcceptMeansNoPreference) {
    EXPECT_TRUE(accept("").empty());
    EXPECT_TRUE(accept("   ").empty());
}

TEST(MediaTypeTest, MalformedAcceptFailsWhole) {
    std::vector<MediaRange> ranges;
    std::string error;
    EXPECT_FALSE(parse_accept("text/html, nonsense", ranges, error));
    EXPECT_FALSE(error.empty());
}

TEST(MediaTypeTest, ExtensionTable) {
    EXPECT_EQ(media_type_for_extension("html")->essence(), "text/html");
    EXPECT_EQ(media_type_for_extension("HTML")->essence(), "text/html");
    EXPECT_EQ(media_type_for_extension("json")->essence(), "application/json");
    EXPECT_EQ(media_type_for_extension("txt")->essence(), "text/plain");
    EXPECT_FALSE(media_type_for_extension("nope").has_value());
    EXPECT_FALSE(media_type_for_extension("").has_value());
}

TEST(MediaTypeTest, MatchSpecificity) {
    MediaType html = type_of("text/html");
    EXPECT_EQ(match_specificity(html, MediaRange::any()), MatchSpecificity::FULL_WILDCARD);
    EXPECT_EQ(match_specificity(html, accept("text/*")[0]), MatchSpecificity::SUBTYPE_WILDCARD);
    EXPECT_EQ(match_specificity(html, MediaRange::exactly(html)), MatchSpecificity::EXACT);
    EXPECT_EQ(match_specificity(html, accept("application/json")[0]), MatchSpecificity::NONE);
    EXPECT_TRUE(is_within(html, accept("text/*")[0]));
}

TEST(MediaTypeTest, RankPrefersQualityThenSpecificity) {
    std::vector<MediaType> candidates = {type_of("text/plain"), type_of("text/html"), type_of("application/json")};
    auto ranking = rank(candidates, accept("text/*;q=0.9, text/html;q=0.9, application/json;q=0.5"));

    ASSERT_EQ(ranking.acceptable.size(), 3u);
    EXPECT_EQ(ranking.acceptable[0].media_type.essence(), "text/html");
    EXPECT_EQ(ranking.acceptable[1].media_type.essence(), "text/plain");
    EXPECT_EQ(ranking.acceptable[2].media_type.essence(), "application/json");
    EXPECT_TRUE(ranking.unacceptable.empty());
}

TEST(MediaTypeTest, RankKeepsDeclarationOrderOnTies) {
    std::vector<MediaType> candidates = {type_of("text/plain"), type_of("text/html"), type_of("image/png")};
    auto ranking = rank(candidates, accept("text/*"));

    ASSERT_EQ(ranking.acceptable.size(), 2u);
    EXPECT_EQ(ranking.acceptable[0].candidate_index, 0u);
    EXPECT_EQ(ranking.acceptable[1].candidate_index, 1u);
    EXPECT_TRUE(ranking.acceptable[0].same_score(ranking.acceptable[1]));
    ASSERT_EQ(ranking.unacceptable.size(), 1u);
    EXPECT_EQ(ranking.unacceptable[0], 2u);
}

TEST(MediaTypeTest, NegotiateFallsBackToDefault) {
    std::vector<MediaType> candidates = {type_of("text/html")};
    MediaType chosen;
    std::string error;

    EXPECT_FALSE(negotiate(candidates, accept("application/json"), std::nullopt, chosen, error));
    EXPECT_NE(error.find("text/html"), std::string::npos);

    ASSERT_TRUE(negotiate(candidates, accept("application/json"), type_of("text/plain"), chosen, error));
    EXPECT_EQ(chosen.essence(), "text/plain");

    ASSERT_TRUE(negotiate(candidates, accept("*/*"), std::nullopt, chosen, error));
    EXPECT_EQ(chosen.essence(), "text/html");
}
