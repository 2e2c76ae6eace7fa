#pragma once

/// @file episode_title.hpp
/// @brief Rules deciding which span of a file name is the episode title

#include <episode_title/config.hpp>
#include <episode_title/rules/rule.hpp>
#include <episode_title/rules/title_base.hpp>

#include <string>
#include <vector>

namespace episode_title {

/// @brief With several titles, the ones right after an episode number become episode titles
class TitleToEpisodeTitle : public Rule {
public:
    [[nodiscard]] std::string id() const override { return "TitleToEpisodeTitle"; }
    [[nodiscard]] std::vector<std::string> dependencies() const override {
        return {"TitleFromPosition"};
    }
    [[nodiscard]] Consequence when(const Matches& matches) const override;
};

/// @brief Carves an episode title out of the hole following episode context
///
/// Runs only in segments that already hold a title, and only when no
/// episode title exists yet. A hole qualifies when the nearest match before
/// it in the same segment is an episode anchor, or when the name carries a
/// CRC32 checksum.
class EpisodeTitleFromPosition : public TitleBaseRule {
public:
    explicit EpisodeTitleFromPosition(EngineConfig config);

    [[nodiscard]] std::string id() const override { return "EpisodeTitleFromPosition"; }
    [[nodiscard]] std::vector<std::string> dependencies() const override {
        return {"TitleToEpisodeTitle"};
    }
    [[nodiscard]] Consequence when(const Matches& matches) const override;

protected:
    [[nodiscard]] bool hole_filter(
        const Match& hole, const Match& filepart, const Matches& matches) const override;
    [[nodiscard]] bool filepart_filter(const Match& filepart, const Matches& matches) const override;
    [[nodiscard]] std::vector<std::string> ignored_names() const override;
    [[nodiscard]] KeepDecision should_keep(
        const Match& match, const std::vector<Match>& to_keep, const Matches& matches,
        const Match& filepart, const Match& hole, bool starting) const override;
};

/// @brief Promotes an alternative title to episode title when its main title is in episode context
class AlternativeTitleReplace : public Rule {
public:
    explicit AlternativeTitleReplace(EngineConfig config);

    [[nodiscard]] std::string id() const override { return "AlternativeTitleReplace"; }
    [[nodiscard]] std::vector<std::string> dependencies() const override {
        return {"EpisodeTitleFromPosition"};
    }
    [[nodiscard]] Consequence when(const Matches& matches) const override;

private:
    EngineConfig config_;
};

/// @brief Infers the series title from the grandparent directory
///
/// @code
/// Serie name/S01/E01-episodeTitle.mkv
/// AAAAAAAAAA/BBB/CCCCCCCCCCCCCCCCCCCC
/// @endcode
///
/// When CCC holds an episode number and BBB a season, the title is the
/// first hole of AAA.
class Filepart3EpisodeTitle : public Rule {
public:
    explicit Filepart3EpisodeTitle(EngineConfig config);

    [[nodiscard]] std::string id() const override { return "Filepart3EpisodeTitle"; }
    [[nodiscard]] Consequence when(const Matches& matches) const override;

private:
    EngineConfig config_;
};

/// @brief Infers the series title from the directory holding the season
///
/// @code
/// Serie name S01/E01-episodeTitle.mkv
/// AAAAAAAAAAAAAA/BBBBBBBBBBBBBBBBBBBB
/// @endcode
class Filepart2EpisodeTitle : public Rule {
public:
    explicit Filepart2EpisodeTitle(EngineConfig config);

    [[nodiscard]] std::string id() const override { return "Filepart2EpisodeTitle"; }
    [[nodiscard]] Consequence when(const Matches& matches) const override;

private:
    EngineConfig config_;
};

}  // namespace episode_title
