#pragma once

#include <string>

#include "render/renderer.hpp"

namespace opr {
namespace render {

/**
 * @brief Renders Handlebars templates
 *
 * Templates are read and compiled on every render so edits are picked up
 * immediately. The binding root is the render context with
 * target-media-type set to the source's declared type.
 *
 * {{get "/route"}} asks the fetcher for that route with the target media
 * type as the only preference and inlines the body verbatim.
 */
class TemplateRenderer : public IRenderer {
public:
    explicit TemplateRenderer(IContentFetcher &fetcher);

    RenderResult render(const content::ContentSource &source, const content::RenderContext &context,
                        const RenderTrace &trace) override;

    /**
     * @brief Renders template text that does not come from a content file
     *
     * name labels error messages. Used by `operator eval`.
     */
    RenderResult render_text(const std::string &name, const std::string &template_text,
                             const content::MediaType &media_type, const content::RenderContext &context,
                             const RenderTrace &trace);

private:
    IContentFetcher &fetcher_;
};

}  // namespace render
}  // namespace opr
