#include "resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "logging/logger.hpp"

namespace fs = std::filesystem;

namespace opr {
namespace content {

namespace {
std::vector<std::string> split_extensions(const std::string &basename) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : basename) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

bool is_missing(const std::error_code &ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

bool has_exec_bit(fs::perms permissions) {
    return (permissions & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) !=
           fs::perms::none;
}

std::string describe_sources(const std::vector<const ContentSource *> &sources) {
    std::string out;
    for (const auto *source : sources) {
        out += (out.empty() ? "" : ", ") + source->relative_path;
    }
    return out;
}
}  // namespace

bool parse_content_file_name(const std::string &basename, bool is_executable, ContentFileName &out,
                             std::string &reason) {
    if (basename.empty() || basename[0] == '.') {
        reason = "hidden file";
        return false;
    }

    auto parts = split_extensions(basename);
    const std::string &name = parts[0];
    if (parts.size() == 1) {
        reason = "content file names must have an extension";
        return false;
    }
    if (parts.size() > 3) {
        reason = "too many extensions (at most two are allowed)";
        return false;
    }
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].empty()) {
            reason = "empty extension";
            return false;
        }
    }

    auto media_type = media_type_for_extension(parts[1]);
    if (!media_type) {
        reason = "extension '" + parts[1] + "' does not map to a known media type";
        return false;
    }

    ContentFileName parsed;
    parsed.logical_name = name;
    parsed.media_type = *media_type;

    if (parts.size() == 2) {
        if (is_executable) {
            reason = "executable with a single extension; executables need two (<name>.<media-ext>.<kind>)";
            return false;
        }
        parsed.strategy = RenderStrategy::STATIC;
    } else if (parts[2] == kTemplateExtension) {
        if (is_executable) {
            reason = "template ('." + std::string(kTemplateExtension) + "') must not be executable";
            return false;
        }
        parsed.strategy = RenderStrategy::TEMPLATE;
    } else {
        if (!is_executable) {
            reason = "two extensions but neither a template nor executable";
            return false;
        }
        parsed.strategy = RenderStrategy::EXECUTABLE;
    }

    out = std::move(parsed);
    return true;
}

ContentResolver::ContentResolver(const std::string &content_directory) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(content_directory, ec), ec);
    root_ = ec ? content_directory : canonical.string();
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

ResolutionOutcome ContentResolver::resolve(const std::string &route_text,
                                           const std::vector<MediaRange> &preferences) const {
    Route route;
    std::string error;
    if (!parse_route(route_text, route, error)) {
        return ResolutionOutcome::failed(ErrorKind::INVALID_ROUTE, error);
    }
    return resolve(route, preferences);
}

ResolutionOutcome ContentResolver::resolve(const Route &route, const std::vector<MediaRange> &preferences) const {
    for (const auto &segment : route.segments()) {
        if (segment[0] == '.') {
            return ResolutionOutcome::failed(ErrorKind::NOT_FOUND, "No content found at route '" + route.str() + "'");
        }
    }

    // "/page.json" asks for the JSON representation of "/page"
    const std::string basename = route.basename();
    auto dot = basename.find_last_of('.');
    if (dot != std::string::npos && dot > 0 && dot + 1 < basename.size()) {
        auto url_media_type = media_type_for_extension(basename.substr(dot + 1));
        if (url_media_type) {
            Route stem = route.parent().child(basename.substr(0, dot));
            std::vector<ContentSource> stem_candidates;
            Failure failure;
            if (!candidates(stem, stem_candidates, failure)) {
                return ResolutionOutcome{false, ContentSource{}, failure};
            }
            if (!stem_candidates.empty()) {
                LOG_DEBUG("[Resolver] " << route.str() << " -> " << stem.str() << " as "
                                        << url_media_type->essence());
                return select(stem, stem_candidates, {MediaRange::exactly(*url_media_type)});
            }
        }
    }

    std::vector<ContentSource> found;
    Failure failure;
    if (!candidates(route, found, failure)) {
        return ResolutionOutcome{false, ContentSource{}, failure};
    }
    return select(route, found, preferences);
}

bool ContentResolver::candidates(const Route &route, std::vector<ContentSource> &out, Failure &failure) const {
    out.clear();
    auto segments = route.segments();

    if (!route.is_root()) {
        std::string parent_dir;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            parent_dir += "/" + segments[i];
        }
        if (!collect(parent_dir, segments.back(), route, Specificity::EXACT, out, failure)) {
            return false;
        }
    }

    std::string route_dir;
    for (const auto &segment : segments) {
        route_dir += "/" + segment;
    }
    return collect(route_dir, kIndexName, route, Specificity::INDEX, out, failure);
}

bool ContentResolver::collect(const std::string &relative_dir, const std::string &logical_name, const Route &route,
                              Specificity specificity, std::vector<ContentSource> &out, Failure &failure) const {
    const fs::path dir = fs::path(root_ + relative_dir);

    std::error_code ec;
    auto dir_status = fs::status(dir, ec);
    if (ec) {
        if (is_missing(ec)) {
            return true;
        }
        failure = Failure(ErrorKind::FORBIDDEN, "Unable to inspect '" + relative_dir + "': " + ec.message());
        return false;
    }
    if (!fs::is_directory(dir_status)) {
        return true;
    }

    std::vector<fs::directory_entry> matches;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        failure = Failure(ErrorKind::FORBIDDEN, "Unable to list '" + relative_dir + "': " + ec.message());
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        // Logical name is everything before the first dot
        if (name.compare(0, logical_name.size(), logical_name) != 0 || name.size() == logical_name.size() ||
            name[logical_name.size()] != '.') {
            continue;
        }
        matches.push_back(*it);
    }
    if (ec) {
        failure = Failure(ErrorKind::FORBIDDEN, "Unable to list '" + relative_dir + "': " + ec.message());
        return false;
    }

    std::sort(matches.begin(), matches.end(), [](const fs::directory_entry &a, const fs::directory_entry &b) {
        return a.path().filename() < b.path().filename();
    });

    for (const auto &entry : matches) {
        const std::string name = entry.path().filename().string();
        const std::string relative_path = (relative_dir.empty() ? "" : relative_dir.substr(1) + "/") + name;

        auto entry_status = fs::status(entry.path(), ec);
        if (ec) {
            // Dangling symlinks and unreadable entries
            failure =
                Failure(ErrorKind::FORBIDDEN, "Unable to inspect content file '" + relative_path + "': " + ec.message());
            return false;
        }
        if (!fs::is_regular_file(entry_status)) {
            continue;
        }
        if (!is_inside_root(entry.path().string())) {
            failure = Failure(ErrorKind::FORBIDDEN,
                              "Content file '" + relative_path + "' resolves outside of the content directory");
            return false;
        }

        ContentFileName parsed;
        std::string reason;
        if (!parse_content_file_name(name, has_exec_bit(entry_status.permissions()), parsed, reason)) {
            LOG_WARN("[Resolver] Ignoring '" << relative_path << "': " << reason);
            continue;
        }

        ContentSource source;
        source.absolute_path = entry.path().string();
        source.relative_path = relative_path;
        source.route = route;
        source.media_type = parsed.media_type;
        source.strategy = parsed.strategy;
        source.specificity = specificity;
        out.push_back(std::move(source));
    }
    return true;
}

nlohmann::json ContentResolver::content_index() const {
    nlohmann::json root_entries = nlohmann::json::object();
    index_directory("", root_entries);
    return nlohmann::json{{"/", root_entries}};
}

void ContentResolver::index_directory(const std::string &relative_dir, nlohmann::json &entries) const {
    std::error_code ec;
    fs::directory_iterator it(fs::path(root_ + relative_dir), ec);
    if (ec) {
        LOG_WARN("[Resolver] Leaving '" << (relative_dir.empty() ? "/" : relative_dir)
                                        << "' out of the content index: " << ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        const std::string relative_path = relative_dir + "/" + name;

        std::error_code status_ec;
        auto link_status = fs::symlink_status(it->path(), status_ec);
        if (status_ec) {
            LOG_DEBUG("[Resolver] Index skips '" << relative_path << "': " << status_ec.message());
            continue;
        }
        if (fs::is_directory(link_status)) {
            nlohmann::json child = nlohmann::json::object();
            index_directory(relative_path, child);
            entries[name + "/"] = std::move(child);
            continue;
        }

        auto entry_status = fs::status(it->path(), status_ec);
        if (status_ec || !fs::is_regular_file(entry_status) || !is_inside_root(it->path().string())) {
            continue;
        }
        ContentFileName parsed;
        std::string reason;
        if (!parse_content_file_name(name, has_exec_bit(entry_status.permissions()), parsed, reason)) {
            continue;
        }
        entries[parsed.logical_name] = relative_dir + "/" + parsed.logical_name;
    }
    if (ec) {
        LOG_WARN("[Resolver] Content index of '" << (relative_dir.empty() ? "/" : relative_dir)
                                                 << "' is incomplete: " << ec.message());
    }
}

ResolutionOutcome ContentResolver::select(const Route &route, const std::vector<ContentSource> &candidates,
                                          const std::vector<MediaRange> &preferences) const {
    if (candidates.empty()) {
        return ResolutionOutcome::failed(ErrorKind::NOT_FOUND, "No content found at route '" + route.str() + "'");
    }

    // Media type groups in declaration order
    std::vector<MediaType> group_types;
    for (const auto &candidate : candidates) {
        if (std::find(group_types.begin(), group_types.end(), candidate.media_type) == group_types.end()) {
            group_types.push_back(candidate.media_type);
        }
    }

    std::vector<MediaType> chosen;
    if (group_types.size() == 1 || preferences.empty()) {
        // No preference: the first group in declaration order answers
        chosen.push_back(group_types.front());
    } else {
        auto ranking = rank(group_types, preferences);
        if (ranking.acceptable.empty()) {
            std::string error;
            MediaType unused;
            negotiate(group_types, preferences, std::nullopt, unused, error);
            return ResolutionOutcome::failed(ErrorKind::UNSUPPORTED_MEDIA_TYPE,
                                             "Content at route '" + route.str() + "' cannot be provided: " + error);
        }
        for (const auto &ranked : ranking.acceptable) {
            if (!ranked.same_score(ranking.acceptable.front())) {
                break;
            }
            chosen.push_back(ranked.media_type);
        }
    }

    std::vector<const ContentSource *> pool;
    for (const auto &candidate : candidates) {
        if (std::find(chosen.begin(), chosen.end(), candidate.media_type) != chosen.end()) {
            pool.push_back(&candidate);
        }
    }

    auto best = std::min_element(pool.begin(), pool.end(), [](const ContentSource *a, const ContentSource *b) {
                    return a->specificity < b->specificity;
                });
    const Specificity best_specificity = (*best)->specificity;

    std::vector<const ContentSource *> remaining;
    for (const auto *source : pool) {
        if (source->specificity == best_specificity) {
            remaining.push_back(source);
        }
    }

    if (remaining.size() > 1) {
        return ResolutionOutcome::failed(ErrorKind::AMBIGUOUS, "Route '" + route.str() +
                                                                   "' matches several equally ranked sources (" +
                                                                   describe_sources(remaining) + ")");
    }

    LOG_DEBUG("[Resolver] " << route.str() << " -> " << remaining.front()->relative_path << " ("
                            << strategy_to_string(remaining.front()->strategy) << ", "
                            << remaining.front()->media_type.essence() << ")");
    return ResolutionOutcome::found(*remaining.front());
}

bool ContentResolver::is_inside_root(const std::string &path) const {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    const std::string resolved = canonical.string();
    if (root_ == "/") {
        return true;
    }
    return resolved.size() > root_.size() && resolved.compare(0, root_.size(), root_) == 0 &&
           resolved[root_.size()] == '/';
}

ResolutionOutcome resolve(const std::string &content_directory, const std::string &route_text,
                          const std::vector<MediaRange> &preferences) {
    return ContentResolver(content_directory).resolve(route_text, preferences);
}

}  // namespace content
}  // namespace opr
