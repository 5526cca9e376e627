#pragma once

#include <optional>
#include <string>
#include <vector>

#include "content/render_context.hpp"
#include "content/resolver.hpp"
#include "render/executable_renderer.hpp"
#include "render/renderer.hpp"
#include "render/static_renderer.hpp"
#include "render/template_renderer.hpp"

namespace opr {
namespace dispatch {

// Settings shared by every request a dispatcher handles
struct EngineConfig {
    std::string content_directory;
    std::string index_route;          // served for "/" when set
    std::string error_handler_route;  // empty: failures are returned as-is
    std::optional<std::string> socket_address;
    std::string operator_path;
    std::string version;
    int executable_timeout_ms = 30000;
    size_t max_get_depth = 16;
};

// One incoming request
struct DispatchRequest {
    std::string route;
    content::Headers headers;
    content::QueryParameters query;
    std::vector<content::MediaRange> preferences;
    std::optional<std::string> socket_address;  // null outside the network front end
};

/**
 * @brief Owns the request lifecycle: resolve, render, error handling
 *
 * Holds no per-request state, so one dispatcher can serve concurrent
 * requests from the HTTP thread pool.
 *
 * Request flow:
 *   Resolving -> Rendering -> Done
 *   any failure (first attempt) -> Resolving(error handler route) -> Done | Failed
 *
 * The error handler runs at most once per request and sees the original
 * request zone plus an error zone.
 */
class Dispatcher : public render::IContentFetcher {
public:
    explicit Dispatcher(EngineConfig config);

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    /**
     * @brief Resolves and renders a request
     *
     * When is_error_attempt is false and an error handler route is
     * configured, a failure is retried once against that route. The result
     * outcome is SUCCESS, ERROR_HANDLED (body from the error handler,
     * failure set to the original failure) or FAILED.
     */
    render::RenderResult handle(const DispatchRequest &request, bool is_error_attempt = false);

    // Network front end: socket address taken from the configuration
    render::RenderResult resolve_and_render(const std::string &route, const content::Headers &headers,
                                            const content::QueryParameters &query,
                                            const std::vector<content::MediaRange> &preferences);

    // Single-shot local render (socket address null)
    render::RenderResult get(const std::string &route, const std::vector<content::MediaRange> &preferences,
                             const content::QueryParameters &query = {});

    /**
     * @brief Renders ad hoc template text
     *
     * The result type is the first concrete media type in preferences, or
     * application/octet-stream. request.route is null. The error handler is
     * not involved.
     */
    render::RenderResult eval(const std::string &template_text, const std::vector<content::MediaRange> &preferences);

    // Nested get from a template: recursion checks, then resolve and render
    render::RenderResult fetch(const std::string &route, const std::vector<content::MediaRange> &preferences,
                               const content::RenderContext &context, const render::RenderTrace &trace) override;

    /**
     * @brief Checks that a configured route resolves to something
     *
     * Used at startup for the index and error handler routes. Ambiguous
     * routes pass since negotiation may settle them per request.
     */
    bool check_route(const std::string &route, std::string &error) const;

    const EngineConfig &config() const { return config_; }

private:
    content::ServerInfo server_info(const std::optional<std::string> &socket_address) const;

    render::RenderResult render_route(const content::Route &route,
                                      const std::vector<content::MediaRange> &preferences,
                                      const content::RenderContext &context, const render::RenderTrace &trace);

    render::IRenderer &renderer_for(content::RenderStrategy strategy);

    EngineConfig config_;
    content::ContentResolver resolver_;
    render::StaticRenderer static_renderer_;
    render::TemplateRenderer template_renderer_;
    render::ExecutableRenderer executable_renderer_;
};

}  // namespace dispatch
}  // namespace opr
