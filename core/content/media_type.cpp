#include "media_type.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace opr {
namespace content {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// RFC 7230 token characters
bool is_token(const std::string &s) {
    if (s.empty()) {
        return false;
    }
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            continue;
        }
        if (std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) == std::string::npos) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_unquoted(const std::string &s, char separator) {
    std::vector<std::string> parts;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            quoted = !quoted;
        } else if (c == '\\' && quoted && i + 1 < s.size()) {
            current.push_back(c);
            c = s[++i];
        } else if (c == separator && !quoted) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.push_back(current);
    return parts;
}

std::string format_parameters(const MediaParameters &parameters) {
    std::string out;
    for (const auto &parameter : parameters) {
        out += "; " + parameter.first + "=" + parameter.second;
    }
    return out;
}

// Shared grammar of media types and media ranges: type "/" subtype *( ";" name "=" value )
bool parse_parts(const std::string &text, std::string &type, std::string &subtype, MediaParameters &parameters,
                 std::string &error) {
    auto pieces = split_unquoted(text, ';');
    std::string essence = trim(pieces[0]);
    auto slash = essence.find('/');
    if (slash == std::string::npos) {
        error = "Malformed media type '" + text + "': missing '/'";
        return false;
    }

    type = to_lower(trim(essence.substr(0, slash)));
    subtype = to_lower(trim(essence.substr(slash + 1)));
    if (!is_token(type) || !is_token(subtype)) {
        error = "Malformed media type '" + text + "'";
        return false;
    }

    parameters.clear();
    for (size_t i = 1; i < pieces.size(); ++i) {
        std::string piece = trim(pieces[i]);
        if (piece.empty()) {
            continue;
        }
        auto eq = piece.find('=');
        if (eq == std::string::npos) {
            error = "Malformed parameter '" + piece + "' in media type '" + text + "'";
            return false;
        }
        std::string name = to_lower(trim(piece.substr(0, eq)));
        std::string value = trim(piece.substr(eq + 1));
        if (!is_token(name) || value.empty()) {
            error = "Malformed parameter '" + piece + "' in media type '" + text + "'";
            return false;
        }
        parameters.emplace_back(name, value);
    }
    return true;
}

const std::unordered_map<std::string, std::string> &extension_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"atom", "application/atom+xml"},
        {"avif", "image/avif"},
        {"bin", "application/octet-stream"},
        {"bmp", "image/bmp"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"gif", "image/gif"},
        {"gz", "application/gzip"},
        {"hbs", "text/x-handlebars-template"},
        {"htm", "text/html"},
        {"html", "text/html"},
        {"ico", "image/x-icon"},
        {"ics", "text/calendar"},
        {"jpeg", "image/jpeg"},
        {"jpg", "image/jpeg"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"jsonld", "application/ld+json"},
        {"md", "text/markdown"},
        {"markdown", "text/markdown"},
        {"mjs", "application/javascript"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
        {"oga", "audio/ogg"},
        {"ogg", "audio/ogg"},
        {"ogv", "video/ogg"},
        {"otf", "font/otf"},
        {"pdf", "application/pdf"},
        {"png", "image/png"},
        {"rss", "application/rss+xml"},
        {"svg", "image/svg+xml"},
        {"tar", "application/x-tar"},
        {"toml", "application/toml"},
        {"ttf", "font/ttf"},
        {"txt", "text/plain"},
        {"wasm", "application/wasm"},
        {"wav", "audio/wav"},
        {"webm", "video/webm"},
        {"webmanifest", "application/manifest+json"},
        {"webp", "image/webp"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"xhtml", "application/xhtml+xml"},
        {"xml", "application/xml"},
        {"yaml", "application/yaml"},
        {"yml", "application/yaml"},
        {"zip", "application/zip"},
    };
    return table;
}
}  // namespace

bool MediaType::parse(const std::string &text, MediaType &out, std::string &error) {
    MediaType parsed;
    if (!parse_parts(text, parsed.type, parsed.subtype, parsed.parameters, error)) {
        return false;
    }
    if (parsed.type == "*" || parsed.subtype == "*") {
        error = "'" + text + "' is a media range, not a specific media type";
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::string MediaType::to_string() const { return essence() + format_parameters(parameters); }

bool MediaRange::parse(const std::string &text, MediaRange &out, std::string &error) {
    MediaRange parsed;
    MediaParameters parameters;
    if (!parse_parts(text, parsed.type, parsed.subtype, parameters, error)) {
        return false;
    }
    if (parsed.type == "*" && parsed.subtype != "*") {
        error = "Malformed media range '" + text + "': '*/" + parsed.subtype + "' is not allowed";
        return false;
    }

    for (const auto &parameter : parameters) {
        if (parameter.first != "q") {
            parsed.parameters.push_back(parameter);
            continue;
        }
        char *end = nullptr;
        double q = std::strtod(parameter.second.c_str(), &end);
        if (end == parameter.second.c_str() || *end != '\0') {
            error = "Malformed quality value '" + parameter.second + "' in '" + text + "'";
            return false;
        }
        parsed.quality = std::min(1.0, std::max(0.0, q));
    }

    out = std::move(parsed);
    return true;
}

MediaRange MediaRange::any() {
    MediaRange range;
    range.type = "*";
    range.subtype = "*";
    return range;
}

MediaRange MediaRange::exactly(const MediaType &media_type) {
    MediaRange range;
    range.type = media_type.type;
    range.subtype = media_type.subtype;
    range.parameters = media_type.parameters;
    return range;
}

std::string MediaRange::to_string() const {
    std::string out = type + "/" + subtype + format_parameters(parameters);
    if (quality < 1.0) {
        std::string q = std::to_string(quality);
        q.erase(q.find_last_not_of('0') + 1);
        if (!q.empty() && q.back() == '.') {
            q.push_back('0');
        }
        out += ";q=" + q;
    }
    return out;
}

MatchSpecificity match_specificity(const MediaType &media_type, const MediaRange &range) {
    if (range.type == "*" && range.subtype == "*") {
        return MatchSpecificity::FULL_WILDCARD;
    }
    if (range.type != media_type.type) {
        return MatchSpecificity::NONE;
    }
    if (range.subtype == "*") {
        return MatchSpecificity::SUBTYPE_WILDCARD;
    }
    return range.subtype == media_type.subtype ? MatchSpecificity::EXACT : MatchSpecificity::NONE;
}

bool parse_accept(const std::string &header, std::vector<MediaRange> &out, std::string &error) {
    std::vector<MediaRange> ranges;
    if (!trim(header).empty()) {
        for (const auto &entry : split_unquoted(header, ',')) {
            std::string item = trim(entry);
            if (item.empty()) {
                continue;
            }
            MediaRange range;
            if (!MediaRange::parse(item, range, error)) {
                return false;
            }
            if (range.quality <= 0.0) {
                continue;
            }
            ranges.push_back(std::move(range));
        }
    }

    std::stable_sort(ranges.begin(), ranges.end(),
                     [](const MediaRange &a, const MediaRange &b) { return a.quality > b.quality; });
    out = std::move(ranges);
    return true;
}

std::optional<MediaType> media_type_for_extension(const std::string &extension) {
    const auto &table = extension_table();
    auto it = table.find(to_lower(extension));
    if (it == table.end()) {
        return std::nullopt;
    }
    MediaType media_type;
    std::string error;
    if (!MediaType::parse(it->second, media_type, error)) {
        return std::nullopt;
    }
    return media_type;
}

MediaTypeRanking rank(const std::vector<MediaType> &candidates, const std::vector<MediaRange> &preferences) {
    MediaTypeRanking ranking;
    for (size_t i = 0; i < candidates.size(); ++i) {
        RankedMediaType best;
        best.media_type = candidates[i];
        best.candidate_index = i;
        for (const auto &preference : preferences) {
            if (preference.quality <= 0.0) {
                continue;
            }
            auto specificity = match_specificity(candidates[i], preference);
            if (specificity == MatchSpecificity::NONE) {
                continue;
            }
            if (preference.quality > best.quality ||
                (preference.quality == best.quality && specificity > best.specificity)) {
                best.quality = preference.quality;
                best.specificity = specificity;
            }
        }
        if (best.specificity == MatchSpecificity::NONE) {
            ranking.unacceptable.push_back(i);
        } else {
            ranking.acceptable.push_back(best);
        }
    }

    std::stable_sort(ranking.acceptable.begin(), ranking.acceptable.end(),
                     [](const RankedMediaType &a, const RankedMediaType &b) {
                         if (a.quality != b.quality) {
                             return a.quality > b.quality;
                         }
                         return a.specificity > b.specificity;
                     });
    return ranking;
}

bool negotiate(const std::vector<MediaType> &candidates, const std::vector<MediaRange> &preferences,
               const std::optional<MediaType> &default_type, MediaType &out, std::string &error) {
    auto ranking = rank(candidates, preferences);
    if (!ranking.acceptable.empty()) {
        out = ranking.acceptable.front().media_type;
        return true;
    }
    if (default_type) {
        out = *default_type;
        return true;
    }

    std::string offered;
    for (const auto &candidate : candidates) {
        offered += (offered.empty() ? "" : ", ") + candidate.essence();
    }
    std::string wanted;
    for (const auto &preference : preferences) {
        wanted += (wanted.empty() ? "" : ", ") + preference.to_string();
    }
    error = "None of the available media types (" + offered + ") is acceptable (" + wanted + ")";
    return false;
}

}  // namespace content
}  // namespace opr
