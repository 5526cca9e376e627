#include "route.hpp"

namespace opr {
namespace content {

namespace {
std::vector<std::string> split_segments(const std::string &path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string join_segments(const std::vector<std::string> &segments) {
    std::string path;
    for (const auto &segment : segments) {
        path += "/" + segment;
    }
    return path.empty() ? "/" : path;
}
}  // namespace

Route::Route() : path_("/") {}

std::vector<std::string> Route::segments() const { return split_segments(path_); }

std::string Route::basename() const {
    auto slash = path_.find_last_of('/');
    return path_.substr(slash + 1);
}

Route Route::parent() const {
    auto segments = split_segments(path_);
    if (!segments.empty()) {
        segments.pop_back();
    }
    return Route(join_segments(segments));
}

Route Route::child(const std::string &segment) const {
    return Route(is_root() ? "/" + segment : path_ + "/" + segment);
}

bool parse_route(const std::string &text, Route &out, std::string &error) {
    if (text.empty() || text[0] != '/') {
        error = "Invalid route '" + text + "': routes must be absolute (start with a '/')";
        return false;
    }

    std::vector<std::string> kept;
    for (const auto &segment : split_segments(text)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            error = "Invalid route '" + text + "': '..' segments are not allowed";
            return false;
        }
        if (segment.find('\0') != std::string::npos || segment.find('\\') != std::string::npos) {
            error = "Invalid route '" + text + "': segment '" + segment + "' contains a forbidden character";
            return false;
        }
        kept.push_back(segment);
    }

    out = Route(join_segments(kept));
    return true;
}

}  // namespace content
}  // namespace opr
