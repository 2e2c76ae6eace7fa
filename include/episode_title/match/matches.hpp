#pragma once

/// @file matches.hpp
/// @brief Mutable match collection and the span queries the rules run against it

#include <episode_title/match/match.hpp>
#include <episode_title/match/predicate.hpp>
#include <episode_title/text/formatters.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace episode_title {

/// @brief Sentinel for "up to the end of the input"
constexpr std::size_t kToEnd = std::numeric_limits<std::size_t>::max();

/// @brief Options for Matches::holes
struct HoleOptions {
    /// Formatter applied to the raw hole text to build its value
    formatters::Formatter formatter;
    /// Characters closing the current hole when met inside it
    std::string seps;
    /// Holes failing this predicate are dropped
    Predicate predicate = HasValue{};
    /// Matches accepted by this predicate do not cover text
    std::optional<Predicate> ignore;
};

/// @brief Picks the element at `index`, if any
[[nodiscard]] std::optional<Match> nth(const std::vector<Match>& matches, std::size_t index = 0);

/// @brief Ordered collection of matches and markers over one input string
///
/// Matches are kept in document order: by start, then end, then insertion.
/// The collection is owned by a single caller and passed by reference from
/// rule to rule; every query returns copies.
class Matches {
public:
    Matches() = default;
    explicit Matches(std::string input_string);

    [[nodiscard]] const std::string& input_string() const { return input_string_; }

    /// @brief Returns the input length, or the largest match end when it is larger
    [[nodiscard]] std::size_t max_end() const;

    [[nodiscard]] std::size_t size() const { return matches_.size(); }
    [[nodiscard]] bool empty() const { return matches_.empty(); }
    [[nodiscard]] const std::vector<Match>& all() const { return matches_; }

    /// @brief Inserts a match in document order
    ///
    /// @throws SpanError if start > end or the span extends past the input
    void append(Match match);

    /// @brief Removes the first entry equal to `match`
    /// @return false if no such entry exists
    bool remove(const Match& match);

    /// @brief Replaces the name of an entry, keeping its span, value and tags
    ///
    /// The old entry is erased and the renamed one inserted in a single call.
    ///
    /// @return false if no entry equal to `match` exists
    bool relabel(const Match& match, const std::string& name);

    /// @brief Adds a marker (path segment, release group)
    ///
    /// @throws SpanError on an invalid span
    void add_marker(Match marker);

    [[nodiscard]] const std::vector<Match>& all_markers() const { return markers_; }

    /// @brief Returns markers with the given name, ordered by start
    [[nodiscard]] std::vector<Match> markers(std::string_view name) const;

    /// @brief Returns matches with the given name in document order
    [[nodiscard]] std::vector<Match> named(
        std::string_view name, const Predicate& predicate = AnyMatch{}) const;

    [[nodiscard]] std::vector<Match> starting(std::size_t index) const;
    [[nodiscard]] std::vector<Match> ending(std::size_t index) const;

    /// @brief Returns matches covering the character at `index`
    [[nodiscard]] std::vector<Match> at_index(std::size_t index) const;

    /// @brief Returns the matches ending nearest before `match`
    ///
    /// Walks back from `match.start` down to `floor` to the first position
    /// where some match ends, and returns those matches that satisfy the
    /// predicate. Matches ending further back are never considered.
    [[nodiscard]] std::vector<Match> previous(
        const Match& match, const Predicate& predicate = AnyMatch{}, std::size_t floor = 0) const;

    /// @brief Returns the matches starting nearest after `match`
    [[nodiscard]] std::vector<Match> next(
        const Match& match, const Predicate& predicate = AnyMatch{},
        std::size_t ceiling = kToEnd) const;

    /// @brief Returns matches fully inside [start, end)
    [[nodiscard]] std::vector<Match> range(
        std::size_t start = 0, std::size_t end = kToEnd,
        const Predicate& predicate = AnyMatch{}) const;

    /// @brief Returns unmatched gaps inside [start, end)
    [[nodiscard]] std::vector<Match> holes(
        std::size_t start, std::size_t end, const HoleOptions& options = {}) const;

    /// @brief Returns matches chained before `position` through separators
    ///
    /// Walks back from `position`, collecting matches satisfying the
    /// predicate and skipping separator characters; stops at the first other
    /// character. Nearest match first.
    [[nodiscard]] std::vector<Match> chain_before(
        std::size_t position, std::string_view seps, const Predicate& predicate = AnyMatch{},
        std::size_t start = 0) const;

    /// @brief Forward counterpart of chain_before
    [[nodiscard]] std::vector<Match> chain_after(
        std::size_t position, std::string_view seps, const Predicate& predicate = AnyMatch{},
        std::size_t end = kToEnd) const;

    /// @brief Rebuilds the value of a span from the input string
    [[nodiscard]] std::string format(
        std::size_t start, std::size_t end, const formatters::Formatter& formatter = {}) const;

    /// @brief Splits a span at separator characters, dropping empty pieces
    [[nodiscard]] std::vector<Match> split(
        const Match& match, std::string_view seps, const formatters::Formatter& formatter = {}) const;

    /// @brief Removes the parts of `match` covered by `by`
    [[nodiscard]] std::vector<Match> crop(
        const Match& match, const std::vector<Match>& by,
        const formatters::Formatter& formatter = {}) const;

private:
    void check_span(const Match& match) const;
    [[nodiscard]] std::vector<Match> filter(
        const std::vector<Match>& matches, const Predicate& predicate) const;

    std::string input_string_;
    std::vector<Match> matches_;
    std::vector<Match> markers_;
};

/// @brief Adds one "path" marker per path segment of the input string
///
/// @param matches Collection whose input string is a file path
/// @param path_seps Characters separating path segments
void add_path_markers(Matches& matches, std::string_view path_seps = "/\\");

/// @brief Serialization for Matches
void to_json(nlohmann::json& j, const Matches& m);
void from_json(const nlohmann::json& j, Matches& m);

}  // namespace episode_title
