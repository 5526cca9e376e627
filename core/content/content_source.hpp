#pragma once

#include <string>

#include "content/errors.hpp"
#include "content/media_type.hpp"
#include "content/route.hpp"

namespace opr {
namespace content {

// How a content source produces its body
enum class RenderStrategy { STATIC, TEMPLATE, EXECUTABLE };

// How precisely a content source matches the requested route
enum class Specificity {
    EXACT = 0,  // <parent>/<name>.<ext>[.<strategy>]
    INDEX = 1   // <route>/index.<ext>[.<strategy>]
};

inline std::string strategy_to_string(RenderStrategy strategy) {
    switch (strategy) {
        case RenderStrategy::STATIC:
            return "static";
        case RenderStrategy::TEMPLATE:
            return "template";
        case RenderStrategy::EXECUTABLE:
            return "executable";
        default:
            return "static";
    }
}

// A file in the content directory that can answer a route. Discovered per
// request by the resolver and discarded afterwards.
struct ContentSource {
    std::string absolute_path;
    std::string relative_path;  // relative to the content directory, '/'-separated
    Route route;                // the logical route the source answers
    MediaType media_type;       // declared by the file name
    RenderStrategy strategy = RenderStrategy::STATIC;
    Specificity specificity = Specificity::EXACT;
};

// Result of resolving a route: a single source, or a typed failure
struct ResolutionOutcome {
    bool success = false;
    ContentSource source;
    Failure failure;

    static ResolutionOutcome found(ContentSource source) {
        ResolutionOutcome outcome;
        outcome.success = true;
        outcome.source = std::move(source);
        return outcome;
    }

    static ResolutionOutcome failed(ErrorKind kind, std::string message) {
        ResolutionOutcome outcome;
        outcome.failure = Failure(kind, std::move(message));
        return outcome;
    }
};

}  // namespace content
}  // namespace opr
