#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace opr {
namespace content {

using MediaParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief A concrete media type (RFC 2046), e.g. "text/html; charset=utf-8"
 *
 * type and subtype are stored lower-case and never contain wildcards.
 * Parameters keep declaration order. Equality compares the essence
 * ("type/subtype") only.
 */
struct MediaType {
    std::string type;
    std::string subtype;
    MediaParameters parameters;

    static bool parse(const std::string &text, MediaType &out, std::string &error);

    std::string essence() const { return type + "/" + subtype; }
    std::string to_string() const;

    bool operator==(const MediaType &other) const { return type == other.type && subtype == other.subtype; }
    bool operator!=(const MediaType &other) const { return !(*this == other); }
};

/**
 * @brief A media range from a preference list, e.g. "text/*;q=0.8"
 *
 * The q parameter is parsed into quality and not kept in parameters.
 */
struct MediaRange {
    std::string type;
    std::string subtype;
    MediaParameters parameters;
    double quality = 1.0;

    static bool parse(const std::string &text, MediaRange &out, std::string &error);

    // "*/*"
    static MediaRange any();

    // A range matching exactly one media type
    static MediaRange exactly(const MediaType &media_type);

    std::string to_string() const;
};

// How precisely a range matches a media type
enum class MatchSpecificity { NONE = 0, FULL_WILDCARD = 1, SUBTYPE_WILDCARD = 2, EXACT = 3 };

MatchSpecificity match_specificity(const MediaType &media_type, const MediaRange &range);

inline bool is_within(const MediaType &media_type, const MediaRange &range) {
    return match_specificity(media_type, range) != MatchSpecificity::NONE;
}

/**
 * @brief Parses an Accept-style preference list
 *
 * Entries are stable-sorted by descending quality and entries with q=0 are
 * dropped. An empty header gives an empty list (no preference). Any
 * malformed entry fails the whole parse.
 */
bool parse_accept(const std::string &header, std::vector<MediaRange> &out, std::string &error);

// Media type conventionally associated with a filename extension (without the dot)
std::optional<MediaType> media_type_for_extension(const std::string &extension);

// A candidate media type scored against a preference list
struct RankedMediaType {
    MediaType media_type;
    size_t candidate_index = 0;  // position in the candidate list given to rank()
    double quality = 0.0;
    MatchSpecificity specificity = MatchSpecificity::NONE;

    bool same_score(const RankedMediaType &other) const {
        return quality == other.quality && specificity == other.specificity;
    }
};

struct MediaTypeRanking {
    std::vector<RankedMediaType> acceptable;  // best first, ties in candidate order
    std::vector<size_t> unacceptable;         // candidate indices compatible with no preference
};

/**
 * @brief Ranks candidates against a preference list
 *
 * A candidate's score is its best (quality, specificity) over all compatible
 * preferences: higher quality wins, then exact > subtype wildcard > full
 * wildcard. Candidates with equal scores keep their declaration order.
 */
MediaTypeRanking rank(const std::vector<MediaType> &candidates, const std::vector<MediaRange> &preferences);

/**
 * @brief Picks the best candidate for a preference list
 *
 * Falls back to default_type when no candidate is acceptable; fails
 * (UnsupportedMediaType) when there is no default either.
 */
bool negotiate(const std::vector<MediaType> &candidates, const std::vector<MediaRange> &preferences,
               const std::optional<MediaType> &default_type, MediaType &out, std::string &error);

}  // namespace content
}  // namespace opr
