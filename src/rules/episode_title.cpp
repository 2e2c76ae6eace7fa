#include <episode_title/rules/episode_title.hpp>

#include <optional>

namespace episode_title {

namespace {

// First non-empty hole of `scanned`, when `filename` holds an episode number,
// `directory` a season and `scanned` no title yet.
std::optional<Match> series_title_hole(
    const Matches& matches, const Match& filename, const Match& directory, const Match& scanned,
    const std::string& title_seps) {
    if (matches.range(filename.start, filename.end, NameIs{names::kEpisodeNumber}).empty()) {
        return std::nullopt;
    }
    if (matches.range(directory.start, directory.end, NameIs{names::kSeason}).empty()) {
        return std::nullopt;
    }
    if (!matches.range(scanned.start, scanned.end, NameIs{names::kTitle}).empty()) {
        return std::nullopt;
    }

    HoleOptions options;
    options.formatter = formatters::cleanup;
    options.seps = title_seps;
    auto hole = nth(matches.holes(scanned.start, scanned.end, options));
    if (hole) {
        hole->name = names::kTitle;
    }
    return hole;
}

}  // namespace

Consequence TitleToEpisodeTitle::when(const Matches& matches) const {
    const auto titles = matches.named(names::kTitle);
    if (titles.size() < 2) {
        return {};
    }

    Consequence consequence;
    for (const auto& title : titles) {
        if (!matches.previous(title, NameIs{names::kEpisodeNumber}).empty()) {
            consequence.relabel.push_back({title, names::kEpisodeTitle});
        }
    }
    return consequence;
}

EpisodeTitleFromPosition::EpisodeTitleFromPosition(EngineConfig config)
    : TitleBaseRule(std::move(config), names::kEpisodeTitle, {names::kTitle}) {}

Consequence EpisodeTitleFromPosition::when(const Matches& matches) const {
    if (!matches.named(names::kEpisodeTitle).empty()) {
        return {};
    }
    return TitleBaseRule::when(matches);
}

bool EpisodeTitleFromPosition::hole_filter(
    const Match& hole, const Match& filepart, const Matches& matches) const {
    if (!matches.previous(hole, NameIn{config().episode_anchors}, filepart.start).empty()) {
        return true;
    }
    return !matches.named(names::kCrc32).empty();
}

bool EpisodeTitleFromPosition::filepart_filter(const Match& filepart, const Matches& matches) const {
    return !matches.range(filepart.start, filepart.end, NameIs{names::kTitle}).empty();
}

std::vector<std::string> EpisodeTitleFromPosition::ignored_names() const {
    auto ignored = TitleBaseRule::ignored_names();
    ignored.push_back(names::kEpisodeDetails);
    return ignored;
}

KeepDecision EpisodeTitleFromPosition::should_keep(
    const Match& match, const std::vector<Match>& to_keep, const Matches& matches,
    const Match& filepart, const Match& hole, bool starting) const {
    if (match.name == names::kEpisodeDetails &&
        matches.previous(match, NameIs{names::kSeason}).empty()) {
        // Keep the details as their own match; the title still spans them.
        return {true, false};
    }
    return TitleBaseRule::should_keep(match, to_keep, matches, filepart, hole, starting);
}

AlternativeTitleReplace::AlternativeTitleReplace(EngineConfig config)
    : config_(std::move(config)) {}

Consequence AlternativeTitleReplace::when(const Matches& matches) const {
    if (!matches.named(names::kEpisodeTitle).empty()) {
        return {};
    }

    const auto alternative_title = nth(matches.named(names::kAlternativeTitle));
    if (!alternative_title) {
        return {};
    }

    const auto main_title =
        nth(matches.chain_before(alternative_title->start, config_.seps, HasTag{names::kTitle}));
    if (!main_title) {
        return {};
    }

    const bool anchored =
        !matches.previous(*main_title, NameIn{config_.episode_anchors}).empty() ||
        !matches.named(names::kCrc32).empty();
    if (!anchored) {
        return {};
    }

    Consequence consequence;
    consequence.relabel.push_back({*alternative_title, names::kEpisodeTitle});
    return consequence;
}

Filepart3EpisodeTitle::Filepart3EpisodeTitle(EngineConfig config) : config_(std::move(config)) {}

Consequence Filepart3EpisodeTitle::when(const Matches& matches) const {
    const auto fileparts = matches.markers(names::kPath);
    if (fileparts.size() < 3) {
        return {};
    }

    const auto& filename = fileparts[fileparts.size() - 1];
    const auto& directory = fileparts[fileparts.size() - 2];
    const auto& subdirectory = fileparts[fileparts.size() - 3];

    Consequence consequence;
    if (auto hole =
            series_title_hole(matches, filename, directory, subdirectory, config_.title_seps)) {
        consequence.append.push_back(std::move(*hole));
    }
    return consequence;
}

Filepart2EpisodeTitle::Filepart2EpisodeTitle(EngineConfig config) : config_(std::move(config)) {}

Consequence Filepart2EpisodeTitle::when(const Matches& matches) const {
    const auto fileparts = matches.markers(names::kPath);
    if (fileparts.size() < 2) {
        return {};
    }

    const auto& filename = fileparts[fileparts.size() - 1];
    const auto& directory = fileparts[fileparts.size() - 2];

    Consequence consequence;
    if (auto hole = series_title_hole(matches, filename, directory, directory, config_.title_seps)) {
        consequence.append.push_back(std::move(*hole));
    }
    return consequence;
}

}  // namespace episode_title
