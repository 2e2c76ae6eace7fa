#pragma once

/// @file title_base.hpp
/// @brief Positional title extraction from unmatched holes of path segments

#include <episode_title/config.hpp>
#include <episode_title/rules/rule.hpp>

#include <optional>
#include <string>
#include <vector>

namespace episode_title {

/// @brief What to do with an ignored match sitting at an edge of a title hole
struct KeepDecision {
    /// Keep the match in the collection instead of removing it
    bool append = false;
    /// Shrink the hole so the title stops at the match
    bool crop = false;
};

/// @brief Base class for rules carving a title out of an unmatched hole
///
/// Path segments are scanned from the one holding the most distinct match
/// names to the one holding the fewest. The first hole accepted by
/// hole_filter becomes a match named `match_name`. When an alternative name
/// is set, the hole is split at the title separators and every piece after
/// the first is named `alternative_match_name`.
class TitleBaseRule : public Rule {
public:
    TitleBaseRule(
        EngineConfig config, std::string match_name, std::vector<std::string> match_tags,
        std::string alternative_match_name = "");

    [[nodiscard]] Consequence when(const Matches& matches) const override;

    [[nodiscard]] const std::string& match_name() const { return match_name_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

protected:
    /// @brief Returns false to skip a candidate hole
    [[nodiscard]] virtual bool hole_filter(
        const Match& hole, const Match& filepart, const Matches& matches) const;

    /// @brief Returns false to skip a whole path segment
    [[nodiscard]] virtual bool filepart_filter(const Match& filepart, const Matches& matches) const;

    /// @brief Names of matches that do not interrupt a hole
    [[nodiscard]] virtual std::vector<std::string> ignored_names() const;

    /// @brief Decides whether an ignored match at the edge of a hole survives
    ///
    /// Languages and countries survive when their raw text is as long as the
    /// hole value, or when the segment holds no other match of the same name
    /// outside the hole. A match leading the hole (`starting`) survives the
    /// second test only when its raw text is at most 3 characters.
    [[nodiscard]] virtual KeepDecision should_keep(
        const Match& match, const std::vector<Match>& to_keep, const Matches& matches,
        const Match& filepart, const Match& hole, bool starting) const;

    /// @brief Looks for a title in one path segment
    [[nodiscard]] std::optional<Consequence> check_titles_in_filepart(
        const Match& filepart, const Matches& matches) const;

private:
    [[nodiscard]] std::vector<Match> split_titles(const Match& hole, const Matches& matches) const;

    EngineConfig config_;
    std::string match_name_;
    std::vector<std::string> match_tags_;
    std::string alternative_match_name_;
};

/// @brief Produces the main title and alternative titles from position
///
/// Does nothing once the collection holds a title.
class TitleFromPosition : public TitleBaseRule {
public:
    explicit TitleFromPosition(EngineConfig config);

    [[nodiscard]] std::string id() const override { return "TitleFromPosition"; }
    [[nodiscard]] Consequence when(const Matches& matches) const override;
};

}  // namespace episode_title
