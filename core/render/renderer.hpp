#pragma once

#include <string>
#include <utility>
#include <vector>

#include "content/content_source.hpp"
#include "content/errors.hpp"
#include "content/media_type.hpp"
#include "content/render_context.hpp"
#include "content/route.hpp"

namespace opr {
namespace render {

// How a dispatched request ended
enum class Outcome {
    SUCCESS,        // the requested route rendered
    ERROR_HANDLED,  // the route failed and the error-handler route rendered instead
    FAILED          // no body could be produced
};

inline const char *outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::SUCCESS:
            return "success";
        case Outcome::ERROR_HANDLED:
            return "error-handled";
        case Outcome::FAILED:
            return "failed";
        default:
            return "failed";
    }
}

/**
 * @brief A rendered body or a typed failure
 *
 * For ERROR_HANDLED results body and media_type come from the error handler
 * while failure holds the original failure, so the caller can pick a status.
 */
struct RenderResult {
    bool success = false;
    std::string body;
    content::MediaType media_type;
    content::Failure failure;
    Outcome outcome = Outcome::FAILED;

    static RenderResult rendered(std::string body, content::MediaType media_type) {
        RenderResult result;
        result.success = true;
        result.body = std::move(body);
        result.media_type = std::move(media_type);
        result.outcome = Outcome::SUCCESS;
        return result;
    }

    static RenderResult failed(content::Failure failure) {
        RenderResult result;
        result.failure = std::move(failure);
        return result;
    }

    static RenderResult failed(content::ErrorKind kind, std::string message) {
        return failed(content::Failure(kind, std::move(message)));
    }
};

/**
 * @brief Routes currently being rendered, outermost first
 *
 * Replaces reliance on the native call stack for detecting cycles in nested
 * get calls. Copies are cheap; push() returns an extended copy.
 */
class RenderTrace {
public:
    explicit RenderTrace(size_t max_depth) : max_depth_(max_depth) {}

    RenderTrace push(const content::Route &route) const {
        RenderTrace next = *this;
        next.routes_.push_back(route);
        return next;
    }

    bool contains(const content::Route &route) const {
        for (const auto &r : routes_) {
            if (r == route) return true;
        }
        return false;
    }

    size_t depth() const { return routes_.size(); }
    size_t max_depth() const { return max_depth_; }

    // "/a -> /b -> /c"
    std::string describe() const {
        std::string out;
        for (const auto &r : routes_) {
            out += (out.empty() ? "" : " -> ") + r.str();
        }
        return out;
    }

private:
    size_t max_depth_;
    std::vector<content::Route> routes_;
};

// One rendering strategy
class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual RenderResult render(const content::ContentSource &source, const content::RenderContext &context,
                                const RenderTrace &trace) = 0;
};

// Resolves and renders another route in-process (the template get helper)
class IContentFetcher {
public:
    virtual ~IContentFetcher() = default;

    virtual RenderResult fetch(const std::string &route, const std::vector<content::MediaRange> &preferences,
                               const content::RenderContext &context, const RenderTrace &trace) = 0;
};

}  // namespace render
}  // namespace opr
