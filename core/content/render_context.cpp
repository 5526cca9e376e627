#include "render_context.hpp"

#include <algorithm>
#include <cctype>

namespace opr {
namespace content {

namespace {
std::string lower_case(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

RenderContext RenderContext::build(const std::optional<Route> &route, const Headers &headers,
                                   const QueryParameters &query, const ServerInfo &server_info) {
    // Repeated headers are folded into one comma-separated value in arrival order
    nlohmann::json header_object = nlohmann::json::object();
    for (const auto &header : headers) {
        std::string name = lower_case(header.first);
        if (header_object.contains(name)) {
            header_object[name] = header_object[name].get<std::string>() + ", " + header.second;
        } else {
            header_object[name] = header.second;
        }
    }

    nlohmann::json query_object = nlohmann::json::object();
    for (const auto &parameter : query) {
        query_object[parameter.first] = parameter.second;
    }

    RenderContext context;
    context.data_ = {
        {keys::kRequest,
         {
             {keys::kRoute, route ? nlohmann::json(route->str()) : nlohmann::json(nullptr)},
             {keys::kHeaders, header_object},
             {keys::kQueryParameters, query_object},
         }},
        {keys::kServerInfo,
         {
             {keys::kSocketAddress,
              server_info.socket_address ? nlohmann::json(*server_info.socket_address) : nlohmann::json(nullptr)},
             {keys::kOperatorPath, server_info.operator_path},
             {keys::kVersion, server_info.version},
         }},
    };
    return context;
}

RenderContext RenderContext::with_error(const RenderContext &context, const Failure &failure) {
    RenderContext copy = context;
    copy.data_[keys::kError] = {
        {keys::kErrorKind, error_kind_to_string(failure.kind)},
        {keys::kErrorMessage, failure.message},
        {keys::kErrorStatusCode, error_kind_to_http(failure.kind)},
    };
    return copy;
}

RenderContext RenderContext::with_target_media_type(const RenderContext &context, const MediaType &media_type) {
    RenderContext copy = context;
    copy.data_[keys::kTargetMediaType] = media_type.to_string();
    return copy;
}

RenderContext RenderContext::with_content_index(const RenderContext &context, const nlohmann::json &index) {
    RenderContext copy = context;
    copy.data_[keys::kContentIndex] = index;
    return copy;
}

std::string RenderContext::serialize() const {
    // Replace invalid UTF-8 (e.g. from raw header bytes) instead of throwing
    return data_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<MediaType> RenderContext::target_media_type() const {
    auto it = data_.find(keys::kTargetMediaType);
    if (it == data_.end() || !it->is_string()) {
        return std::nullopt;
    }
    MediaType media_type;
    std::string error;
    if (!MediaType::parse(it->get<std::string>(), media_type, error)) {
        return std::nullopt;
    }
    return media_type;
}

}  // namespace content
}  // namespace opr
