/**
 * template_renderer_test.cpp - TemplateRenderer with a mocked fetcher
 *
 * Tests:
 * - Binding root is the render context plus target-media-type
 * - get asks the fetcher for the target media type only
 * - Nested failures: RecursionError kept, others wrapped as TemplateError
 * - Error messages name the template file
 */

#include "render/template_renderer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "content_fixture.hpp"
#include "mocks/mock_content_fetcher.hpp"

using namespace opr;
using namespace opr::render;
using content::ErrorKind;
using ::testing::_;
using ::testing::Return;

class TemplateRendererTest : public tests::ContentDirectoryTest {
protected:
    tests::MockContentFetcher fetcher_;
    TemplateRenderer renderer_{fetcher_};

    content::RenderContext context() const {
        content::Route route;
        std::string error;
        EXPECT_TRUE(content::parse_route("/page", route, error)) << error;
        content::ServerInfo info;
        info.operator_path = "/usr/bin/operator";
        info.version = "9.9.9";
        return content::RenderContext::build(route, {{"Accept", "text/html"}}, {{"name", "World"}}, info);
    }

    content::ContentSource source(const std::string &relative_path, const std::string &text,
                                  const std::string &media_extension = "html") {
        auto path = write(relative_path, text);
        content::ContentSource source;
        source.absolute_path = path.string();
        source.relative_path = relative_path;
        source.media_type = *content::media_type_for_extension(media_extension);
        source.strategy = content::RenderStrategy::TEMPLATE;
        return source;
    }
};

TEST_F(TemplateRendererTest, BindsRenderContext) {
    auto src = source("page.html.hbs",
                      "{{request.route}} {{request.query-parameters.name}} {{request.headers.accept}} "
                      "{{server-info.version}} {{target-media-type}}");

    EXPECT_CALL(fetcher_, fetch(_, _, _, _)).Times(0);
    RenderResult result = renderer_.render(src, context(), RenderTrace(16));

    ASSERT_TRUE(result.success) << result.failure.describe();
    EXPECT_EQ(result.body, "/page World text/html 9.9.9 text/html");
    EXPECT_EQ(result.media_type.essence(), "text/html");
}

TEST_F(TemplateRendererTest, SocketAddressIsNullLocally) {
    auto src = source("page.txt.hbs", "{{#if server-info.socket-address}}net{{else}}local{{/if}}", "txt");
    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_TRUE(result.success) << result.failure.describe();
    EXPECT_EQ(result.body, "local");
}

TEST_F(TemplateRendererTest, GetInlinesNestedBody) {
    auto src = source("page.html.hbs", "<main>{{get \"/fragment\"}}</main>");

    RenderTrace trace = RenderTrace(16).push(content::Route());
    EXPECT_CALL(fetcher_, fetch("/fragment", _, _, _))
        .WillOnce([](const std::string &, const std::vector<content::MediaRange> &preferences,
                     const content::RenderContext &bound, const RenderTrace &nested_trace) {
            EXPECT_EQ(preferences.size(), 1u);
            EXPECT_EQ(preferences[0].type + "/" + preferences[0].subtype, "text/html");
            EXPECT_EQ(bound.data()["target-media-type"], "text/html");
            EXPECT_EQ(bound.data()["request"]["route"], "/page");
            EXPECT_EQ(nested_trace.depth(), 1u);
            return RenderResult::rendered("<b>&unescaped</b>", content::MediaType{"text", "html", {}});
        });

    RenderResult result = renderer_.render(src, context(), trace);
    ASSERT_TRUE(result.success) << result.failure.describe();
    EXPECT_EQ(result.body, "<main><b>&unescaped</b></main>");
}

TEST_F(TemplateRendererTest, GetWithPathArgument) {
    auto src = source("page.html.hbs", "{{get request.query-parameters.name}}");
    EXPECT_CALL(fetcher_, fetch("World", _, _, _))
        .WillOnce(Return(RenderResult::failed(ErrorKind::INVALID_ROUTE, "Invalid route 'World'")));

    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::TEMPLATE_ERROR);
    EXPECT_NE(result.failure.message.find("InvalidRoute"), std::string::npos);
}

TEST_F(TemplateRendererTest, GetNonStringArgumentFails) {
    auto src = source("page.html.hbs", "{{get 42}}");
    EXPECT_CALL(fetcher_, fetch(_, _, _, _)).Times(0);

    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::TEMPLATE_ERROR);
    EXPECT_NE(result.failure.message.find("page.html.hbs:1:1"), std::string::npos);
}

TEST_F(TemplateRendererTest, NestedNotFoundBecomesTemplateError) {
    auto src = source("page.html.hbs", "\n  {{get \"/missing\"}}");
    EXPECT_CALL(fetcher_, fetch("/missing", _, _, _))
        .WillOnce(Return(RenderResult::failed(ErrorKind::NOT_FOUND, "No content found at route '/missing'")));

    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::TEMPLATE_ERROR);
    EXPECT_NE(result.failure.message.find("page.html.hbs:2:3"), std::string::npos) << result.failure.message;
    EXPECT_NE(result.failure.message.find("NotFound"), std::string::npos);
    EXPECT_NE(result.failure.message.find("/missing"), std::string::npos);
}

TEST_F(TemplateRendererTest, NestedRecursionErrorKeepsKind) {
    auto src = source("page.html.hbs", "{{get \"/page\"}}");
    EXPECT_CALL(fetcher_, fetch("/page", _, _, _))
        .WillOnce(Return(RenderResult::failed(ErrorKind::RECURSION_ERROR, "cycle")));

    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::RECURSION_ERROR);
    EXPECT_EQ(result.failure.message, "cycle");
}

TEST_F(TemplateRendererTest, CompileErrorNamesFile) {
    auto src = source("broken.html.hbs", "ok\n{{#if x}}unclosed");
    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::TEMPLATE_ERROR);
    EXPECT_NE(result.failure.message.find("broken.html.hbs:2:1"), std::string::npos) << result.failure.message;
}

TEST_F(TemplateRendererTest, MissingReferenceNamesFile) {
    auto src = source("page.html.hbs", "{{request.nothing}}");
    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::TEMPLATE_ERROR);
    EXPECT_EQ(result.failure.message.rfind("page.html.hbs:1:1: ", 0), 0u) << result.failure.message;
}

TEST_F(TemplateRendererTest, MissingFileIsNotFound) {
    content::ContentSource src;
    src.absolute_path = (root_ / "gone.html.hbs").string();
    src.relative_path = "gone.html.hbs";
    src.media_type = content::MediaType{"text", "html", {}};

    RenderResult result = renderer_.render(src, context(), RenderTrace(16));
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.failure.kind, ErrorKind::NOT_FOUND);
}

TEST_F(TemplateRendererTest, RenderTextForAdHocTemplates) {
    content::MediaType plain{"text", "plain", {}};
    RenderResult result =
        renderer_.render_text("<stdin>", "{{target-media-type}}", plain, context(), RenderTrace(16));
    ASSERT_TRUE(result.success) << result.failure.describe();
    EXPECT_EQ(result.body, "text/plain");
    EXPECT_EQ(result.media_type.essence(), "text/plain");
}
