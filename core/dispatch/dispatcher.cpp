#include "dispatcher.hpp"

#include "logging/logger.hpp"

namespace opr {
namespace dispatch {

namespace {
const char *kEvalName = "<stdin>";

bool is_concrete(const content::MediaRange &range) { return range.type != "*" && range.subtype != "*"; }
}  // namespace

Dispatcher::Dispatcher(EngineConfig config)
    : config_(std::move(config)),
      resolver_(config_.content_directory),
      template_renderer_(*this),
      executable_renderer_(resolver_.content_directory(), config_.executable_timeout_ms) {}

content::ServerInfo Dispatcher::server_info(const std::optional<std::string> &socket_address) const {
    content::ServerInfo info;
    info.socket_address = socket_address;
    info.operator_path = config_.operator_path;
    info.version = config_.version;
    return info;
}

render::IRenderer &Dispatcher::renderer_for(content::RenderStrategy strategy) {
    switch (strategy) {
        case content::RenderStrategy::TEMPLATE:
            return template_renderer_;
        case content::RenderStrategy::EXECUTABLE:
            return executable_renderer_;
        case content::RenderStrategy::STATIC:
        default:
            return static_renderer_;
    }
}

render::RenderResult Dispatcher::render_route(const content::Route &route,
                                              const std::vector<content::MediaRange> &preferences,
                                              const content::RenderContext &context,
                                              const render::RenderTrace &trace) {
    content::ResolutionOutcome resolution = resolver_.resolve(route, preferences);
    if (!resolution.success) {
        return render::RenderResult::failed(resolution.failure);
    }
    return renderer_for(resolution.source.strategy).render(resolution.source, context, trace);
}

render::RenderResult Dispatcher::handle(const DispatchRequest &request, bool is_error_attempt) {
    content::Route route;
    std::string error;
    const bool valid = content::parse_route(request.route, route, error);

    const content::RenderContext context = content::RenderContext::with_content_index(
        content::RenderContext::build(valid ? std::optional<content::Route>(route) : std::nullopt, request.headers,
                                      request.query, server_info(request.socket_address)),
        resolver_.content_index());

    render::RenderResult result;
    if (!valid) {
        result = render::RenderResult::failed(content::ErrorKind::INVALID_ROUTE, error);
    } else {
        content::Route target = route;
        bool target_valid = true;
        if (route.is_root() && !config_.index_route.empty()) {
            std::string index_error;
            target_valid = content::parse_route(config_.index_route, target, index_error);
            if (!target_valid) {
                result = render::RenderResult::failed(content::ErrorKind::INVALID_ROUTE,
                                                      "Index route is invalid: " + index_error);
            }
        }
        if (target_valid) {
            render::RenderTrace trace = render::RenderTrace(config_.max_get_depth).push(target);
            result = render_route(target, request.preferences, context, trace);
        }
    }

    if (result.success) {
        result.outcome = render::Outcome::SUCCESS;
        return result;
    }

    const content::Failure original = result.failure;
    LOG_WARN("[Dispatch] " << request.route << ": " << original.describe());

    if (is_error_attempt || config_.error_handler_route.empty()) {
        result.outcome = render::Outcome::FAILED;
        return result;
    }

    // Exactly one extra hop: the error handler renders with the error zone set
    content::Route handler_route;
    render::RenderResult handled;
    if (!content::parse_route(config_.error_handler_route, handler_route, error)) {
        handled = render::RenderResult::failed(content::ErrorKind::INVALID_ROUTE, error);
    } else {
        const content::RenderContext error_context = content::RenderContext::with_error(context, original);
        render::RenderTrace trace = render::RenderTrace(config_.max_get_depth).push(handler_route);
        handled = render_route(handler_route, request.preferences, error_context, trace);
    }

    if (handled.success) {
        LOG_DEBUG("[Dispatch] " << request.route << " handled by " << config_.error_handler_route);
        handled.outcome = render::Outcome::ERROR_HANDLED;
        handled.failure = original;
        return handled;
    }

    LOG_ERROR("[Dispatch] Error handler " << config_.error_handler_route
                                          << " failed: " << handled.failure.describe());
    render::RenderResult fatal = render::RenderResult::failed(
        content::ErrorKind::ERROR_HANDLER_FAILED, "Error handler route '" + config_.error_handler_route +
                                                      "' failed (" + handled.failure.describe() +
                                                      ") while handling " + original.describe());
    fatal.failure.original_kind = original.kind;
    fatal.outcome = render::Outcome::FAILED;
    return fatal;
}

render::RenderResult Dispatcher::resolve_and_render(const std::string &route, const content::Headers &headers,
                                                    const content::QueryParameters &query,
                                                    const std::vector<content::MediaRange> &preferences) {
    DispatchRequest request;
    request.route = route;
    request.headers = headers;
    request.query = query;
    request.preferences = preferences;
    request.socket_address = config_.socket_address;
    return handle(request);
}

render::RenderResult Dispatcher::get(const std::string &route, const std::vector<content::MediaRange> &preferences,
                                     const content::QueryParameters &query) {
    DispatchRequest request;
    request.route = route;
    request.query = query;
    request.preferences = preferences;
    return handle(request);
}

render::RenderResult Dispatcher::eval(const std::string &template_text,
                                      const std::vector<content::MediaRange> &preferences) {
    content::MediaType media_type{"application", "octet-stream", {}};
    for (const auto &preference : preferences) {
        if (is_concrete(preference)) {
            media_type = content::MediaType{preference.type, preference.subtype, preference.parameters};
            break;
        }
    }

    const content::RenderContext context = content::RenderContext::with_content_index(
        content::RenderContext::build(std::nullopt, {}, {}, server_info(std::nullopt)), resolver_.content_index());
    render::RenderResult result = template_renderer_.render_text(kEvalName, template_text, media_type, context,
                                                                 render::RenderTrace(config_.max_get_depth));
    result.outcome = result.success ? render::Outcome::SUCCESS : render::Outcome::FAILED;
    return result;
}

render::RenderResult Dispatcher::fetch(const std::string &route_text,
                                       const std::vector<content::MediaRange> &preferences,
                                       const content::RenderContext &context, const render::RenderTrace &trace) {
    content::Route route;
    std::string error;
    if (!content::parse_route(route_text, route, error)) {
        return render::RenderResult::failed(content::ErrorKind::INVALID_ROUTE, error);
    }
    if (trace.contains(route)) {
        return render::RenderResult::failed(
            content::ErrorKind::RECURSION_ERROR,
            "Route '" + route.str() + "' is already being rendered (" + trace.push(route).describe() + ")");
    }
    if (trace.depth() >= trace.max_depth()) {
        return render::RenderResult::failed(content::ErrorKind::RECURSION_ERROR,
                                            "Nested get depth limit of " + std::to_string(trace.max_depth()) +
                                                " reached at '" + route.str() + "'");
    }
    LOG_DEBUG("[Dispatch] get " << route.str() << " (depth " << trace.depth() + 1 << ")");
    return render_route(route, preferences, context, trace.push(route));
}

bool Dispatcher::check_route(const std::string &route, std::string &error) const {
    content::ResolutionOutcome outcome = resolver_.resolve(route, {});
    if (outcome.success) {
        return true;
    }
    switch (outcome.failure.kind) {
        case content::ErrorKind::AMBIGUOUS:
        case content::ErrorKind::UNSUPPORTED_MEDIA_TYPE:
            return true;
        default:
            error = outcome.failure.describe();
            return false;
    }
}

}  // namespace dispatch
}  // namespace opr
