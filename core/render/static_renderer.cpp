#include "static_renderer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "logging/logger.hpp"

namespace opr {
namespace render {

bool read_content_file(const content::ContentSource &source, std::string &out, content::Failure &failure) {
    errno = 0;
    std::ifstream file(source.absolute_path, std::ios::binary);
    if (!file) {
        const int err = errno;
        const bool denied = err == EACCES || err == EPERM;
        failure = content::Failure(denied ? content::ErrorKind::FORBIDDEN : content::ErrorKind::NOT_FOUND,
                                   "Unable to open '" + source.relative_path + "'" +
                                       (err != 0 ? std::string(": ") + std::strerror(err) : std::string()));
        return false;
    }

    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        failure = content::Failure(content::ErrorKind::FORBIDDEN, "Unable to read '" + source.relative_path + "'");
        return false;
    }
    return true;
}

RenderResult StaticRenderer::render(const content::ContentSource &source, const content::RenderContext &,
                                    const RenderTrace &) {
    std::string body;
    content::Failure failure;
    if (!read_content_file(source, body, failure)) {
        return RenderResult::failed(failure);
    }
    LOG_DEBUG("[Static] " << source.relative_path << " (" << body.size() << " bytes)");
    return RenderResult::rendered(std::move(body), source.media_type);
}

}  // namespace render
}  // namespace opr
