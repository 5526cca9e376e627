#include "template_renderer.hpp"

#include "logging/logger.hpp"
#include "render/static_renderer.hpp"
#include "render/template/evaluator.hpp"
#include "render/template/template.hpp"

namespace opr {
namespace render {

TemplateRenderer::TemplateRenderer(IContentFetcher &fetcher) : fetcher_(fetcher) {}

RenderResult TemplateRenderer::render(const content::ContentSource &source, const content::RenderContext &context,
                                      const RenderTrace &trace) {
    std::string text;
    content::Failure failure;
    if (!read_content_file(source, text, failure)) {
        return RenderResult::failed(failure);
    }
    return render_text(source.relative_path, text, source.media_type, context, trace);
}

RenderResult TemplateRenderer::render_text(const std::string &name, const std::string &template_text,
                                           const content::MediaType &media_type,
                                           const content::RenderContext &context, const RenderTrace &trace) {
    tmpl::Template compiled;
    std::string error;
    if (!tmpl::compile_template(template_text, compiled, error)) {
        LOG_WARN("[Template] Compile error in " << name << ":" << error);
        return RenderResult::failed(content::ErrorKind::TEMPLATE_ERROR,
                                    "Invalid template " + name + ":" + error);
    }

    const content::RenderContext bound = content::RenderContext::with_target_media_type(context, media_type);

    bool failed_in_get = false;
    tmpl::GetHandler get = [&](const nlohmann::json &argument, const tmpl::SourcePosition &position,
                               std::string &out, content::Failure &get_failure) {
        const std::string where = name + ":" + position.to_string();
        failed_in_get = true;
        if (!argument.is_string()) {
            get_failure = content::Failure(content::ErrorKind::TEMPLATE_ERROR,
                                           where + ": the 'get' helper needs a route string, got " + argument.dump());
            return false;
        }
        const std::string route = argument.get<std::string>();

        RenderResult nested = fetcher_.fetch(route, {content::MediaRange::exactly(media_type)}, bound, trace);
        if (!nested.success) {
            if (nested.failure.kind == content::ErrorKind::RECURSION_ERROR) {
                get_failure = nested.failure;
            } else {
                get_failure = content::Failure(content::ErrorKind::TEMPLATE_ERROR,
                                               where + ": get \"" + route + "\" failed: " + nested.failure.describe());
            }
            return false;
        }
        failed_in_get = false;
        out = std::move(nested.body);
        return true;
    };

    std::string body;
    content::Failure failure;
    if (!tmpl::evaluate_template(compiled, bound.data(), get, body, failure)) {
        if (!failed_in_get) {
            failure.message = name + ":" + failure.message;
        }
        LOG_WARN("[Template] " << failure.describe());
        return RenderResult::failed(failure);
    }

    LOG_DEBUG("[Template] " << name << " rendered (" << body.size() << " bytes, " << media_type.essence() << ")");
    return RenderResult::rendered(std::move(body), media_type);
}

}  // namespace render
}  // namespace opr
