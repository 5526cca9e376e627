#include "content/route.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace opr::content;

namespace {
Route parse_ok(const std::string &text) {
    Route route;
    std::string error;
    EXPECT_TRUE(parse_route(text, route, error)) << text << ": " << error;
    return route;
}
}  // namespace

TEST(RouteTest, DefaultIsRoot) {
    Route route;
    EXPECT_EQ(route.str(), "/");
    EXPECT_TRUE(route.is_root());
    EXPECT_TRUE(route.segments().empty());
}

TEST(RouteTest, NormalizesSlashesAndDots) {
    EXPECT_EQ(parse_ok("/").str(), "/");
    EXPECT_EQ(parse_ok("//").str(), "/");
    EXPECT_EQ(parse_ok("/a/b/").str(), "/a/b");
    EXPECT_EQ(parse_ok("/a//b").str(), "/a/b");
    EXPECT_EQ(parse_ok("/./a/./b/.").str(), "/a/b");
}

TEST(RouteTest, RejectsRelativeRoutes) {
    Route route;
    std::string error;
    EXPECT_FALSE(parse_route("", route, error));
    EXPECT_FALSE(parse_route("a/b", route, error));
    EXPECT_NE(error.find("absolute"), std::string::npos);
}

TEST(RouteTest, RejectsParentSegments) {
    Route route;
    std::string error;
    EXPECT_FALSE(parse_route("/a/../b", route, error));
    EXPECT_FALSE(parse_route("/..", route, error));
    EXPECT_NE(error.find(".."), std::string::npos);
}

TEST(RouteTest, RejectsForbiddenCharacters) {
    Route route;
    std::string error;
    EXPECT_FALSE(parse_route("/a\\b", route, error));
    EXPECT_FALSE(parse_route(std::string("/a\0b", 4), route, error));
}

TEST(RouteTest, NavigatesSegments) {
    Route route = parse_ok("/docs/guide/intro");
    EXPECT_EQ(route.basename(), "intro");
    EXPECT_EQ(route.parent().str(), "/docs/guide");
    EXPECT_EQ(route.parent().parent().parent().str(), "/");
    EXPECT_EQ(Route().parent().str(), "/");
    EXPECT_EQ(Route().basename(), "");
    EXPECT_EQ(route.parent().child("other").str(), "/docs/guide/other");
    EXPECT_EQ(Route().child("top").str(), "/top");

    auto segments = route.segments();
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], "docs");
    EXPECT_EQ(segments[2], "intro");
}

TEST(RouteTest, KeepsSegmentsWithDotsAndSpaces) {
    EXPECT_EQ(parse_ok("/page.json").basename(), "page.json");
    EXPECT_EQ(parse_ok("/my page").str(), "/my page");
    EXPECT_EQ(parse_ok("/.hidden").str(), "/.hidden");
}
