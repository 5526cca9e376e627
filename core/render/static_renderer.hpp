#pragma once

#include <string>

#include "render/renderer.hpp"

namespace opr {
namespace render {

// Reads a whole file. On failure sets failure (Forbidden for permission
// problems, NotFound otherwise) and returns false.
bool read_content_file(const content::ContentSource &source, std::string &out, content::Failure &failure);

// Serves the source file's bytes unchanged with its declared media type
class StaticRenderer : public IRenderer {
public:
    RenderResult render(const content::ContentSource &source, const content::RenderContext &context,
                        const RenderTrace &trace) override;
};

}  // namespace render
}  // namespace opr
