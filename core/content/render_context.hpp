#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "content/errors.hpp"
#include "content/media_type.hpp"
#include "content/route.hpp"

namespace opr {
namespace content {

// Request headers in arrival order; names are matched case-insensitively
using Headers = std::vector<std::pair<std::string, std::string>>;

using QueryParameters = std::map<std::string, std::string>;

// Facts about the running server exposed to renderers
struct ServerInfo {
    std::optional<std::string> socket_address;  // "host:port"; empty when not serving over a network
    std::string operator_path;                  // absolute path of the running binary
    std::string version;
};

// Property names of the render context wire form
namespace keys {
constexpr const char *kRequest = "request";
constexpr const char *kRoute = "route";
constexpr const char *kHeaders = "headers";
constexpr const char *kQueryParameters = "query-parameters";
constexpr const char *kServerInfo = "server-info";
constexpr const char *kSocketAddress = "socket-address";
constexpr const char *kOperatorPath = "operator-path";
constexpr const char *kVersion = "version";
constexpr const char *kTargetMediaType = "target-media-type";
constexpr const char *kError = "error";
constexpr const char *kErrorKind = "kind";
constexpr const char *kErrorMessage = "message";
constexpr const char *kErrorStatusCode = "status-code";
constexpr const char *kContentIndex = "/";
}  // namespace keys

/**
 * @brief The data every renderer receives
 *
 * Zones:
 * - request: route (null outside a request), headers, query-parameters
 * - server-info: socket-address (string or null), operator-path, version
 * - error: only on error-handler dispatch
 * - target-media-type: set once a source has been selected
 * - "/": the content index (see ContentResolver::content_index)
 *
 * Values are immutable; the with_* functions return modified copies.
 * build() is a pure function of its inputs so the same request always
 * serializes to the same bytes.
 */
class RenderContext {
public:
    static RenderContext build(const std::optional<Route> &route, const Headers &headers,
                               const QueryParameters &query, const ServerInfo &server_info);

    static RenderContext with_error(const RenderContext &context, const Failure &failure);

    static RenderContext with_target_media_type(const RenderContext &context, const MediaType &media_type);

    static RenderContext with_content_index(const RenderContext &context, const nlohmann::json &index);

    // Binding root for templates
    const nlohmann::json &data() const { return data_; }

    // Single-line JSON, keys sorted
    std::string serialize() const;

    bool has_error() const { return data_.contains(keys::kError); }

    // Value of target-media-type, if set and valid
    std::optional<MediaType> target_media_type() const;

private:
    RenderContext() = default;

    nlohmann::json data_;
};

}  // namespace content
}  // namespace opr
