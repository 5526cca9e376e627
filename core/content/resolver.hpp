#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "content/content_source.hpp"
#include "content/media_type.hpp"
#include "content/route.hpp"

namespace opr {
namespace content {

// Extension marking a Handlebars template: <name>.<media-extension>.hbs
constexpr const char *kTemplateExtension = "hbs";

// Logical name of a directory's own content source: <dir>/index.<ext>[.<strategy>]
constexpr const char *kIndexName = "index";

// A content file name split according to the naming convention
struct ContentFileName {
    std::string logical_name;
    MediaType media_type;
    RenderStrategy strategy = RenderStrategy::STATIC;
};

/**
 * @brief Interprets a content file's basename
 *
 * Grammar:
 *   <name>.<media-ext>             static (must not be executable)
 *   <name>.<media-ext>.hbs         template (must not be executable)
 *   <name>.<media-ext>.<anything>  executable (must be executable)
 *
 * Returns false with a reason for names that are not content sources
 * (hidden names, missing or unknown extensions, wrong executable bit, too
 * many extensions).
 */
bool parse_content_file_name(const std::string &basename, bool is_executable, ContentFileName &out,
                             std::string &reason);

/**
 * @brief Maps routes to content sources in a content directory
 *
 * Stateless apart from the directory root: every call walks the relevant
 * directories afresh, so concurrent calls need no locking and content
 * changes are visible on the next request.
 */
class ContentResolver {
public:
    explicit ContentResolver(const std::string &content_directory);

    const std::string &content_directory() const { return root_; }

    /**
     * @brief Selects the content source answering a route
     *
     * Candidates are the exact-name sources in the route's parent directory
     * and the index sources in the directory named by the route. They are
     * grouped by media type and negotiated against preferences. With no
     * preferences the first group in declaration order is taken (exact
     * before index, then file name). The chosen group(s) are narrowed by
     * specificity; equal-ranked leftovers are Ambiguous.
     *
     * A last segment of the form <stem>.<media-ext> is resolved as <stem>
     * with the preferences replaced by that media type.
     */
    ResolutionOutcome resolve(const Route &route, const std::vector<MediaRange> &preferences) const;

    // Parses route_text first (InvalidRoute on failure)
    ResolutionOutcome resolve(const std::string &route_text, const std::vector<MediaRange> &preferences) const;

    /**
     * @brief All candidate sources for a route in declaration order
     *
     * Exact matches come before index matches; within each, sorted by file
     * name. Returns false with failure set (Forbidden) when a directory or
     * entry could not be inspected.
     */
    bool candidates(const Route &route, std::vector<ContentSource> &out, Failure &failure) const;

    /**
     * @brief Tree of every route the content directory answers
     *
     * Shape: {"/": {"about/": {"team": "/about/team"}, "home": "/home"}}.
     * Directory keys end with '/', file keys are logical names mapping to
     * their route. Hidden and misnamed files, symlinked directories and
     * files resolving outside the content directory are left out;
     * unreadable directories are logged and skipped.
     */
    nlohmann::json content_index() const;

private:
    void index_directory(const std::string &relative_dir, nlohmann::json &entries) const;

    bool collect(const std::string &relative_dir, const std::string &logical_name, const Route &route,
                 Specificity specificity, std::vector<ContentSource> &out, Failure &failure) const;

    ResolutionOutcome select(const Route &route, const std::vector<ContentSource> &candidates,
                             const std::vector<MediaRange> &preferences) const;

    bool is_inside_root(const std::string &path) const;

    std::string root_;
};

// One-shot resolution without keeping a resolver around
ResolutionOutcome resolve(const std::string &content_directory, const std::string &route_text,
                          const std::vector<MediaRange> &preferences);

}  // namespace content
}  // namespace opr
