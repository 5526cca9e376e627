#pragma once

#include <string>
#include <utility>
#include <vector>

namespace opr {
namespace content {

/**
 * @brief A normalized, absolute, '/'-rooted logical path
 *
 * Invariants (enforced by parse_route):
 * - always begins with '/'
 * - no empty, "." or ".." segments
 * - no trailing '/' except for the root route itself
 */
class Route {
public:
    // Root route "/"
    Route();

    const std::string &str() const { return path_; }
    bool is_root() const { return path_ == "/"; }

    std::vector<std::string> segments() const;

    // Last segment ("" for the root route)
    std::string basename() const;

    // Route without its last segment (root for single-segment routes and for root)
    Route parent() const;

    // Appends one segment; the segment must be a valid route segment
    Route child(const std::string &segment) const;

    bool operator==(const Route &other) const { return path_ == other.path_; }
    bool operator!=(const Route &other) const { return path_ != other.path_; }
    bool operator<(const Route &other) const { return path_ < other.path_; }

private:
    explicit Route(std::string path) : path_(std::move(path)) {}

    std::string path_;

    friend bool parse_route(const std::string &text, Route &out, std::string &error);
};

// Normalizes text into a Route. Fails for relative paths, ".." segments and
// segments containing NUL or backslash characters.
bool parse_route(const std::string &text, Route &out, std::string &error);

}  // namespace content
}  // namespace opr
