#include <episode_title/rules/title_base.hpp>

#include <algorithm>
#include <set>

namespace episode_title {

namespace {

bool contains(const std::vector<Match>& matches, const Match& match) {
    return std::find(matches.begin(), matches.end(), match) != matches.end();
}

// Number of distinct match names inside a segment.
std::size_t marker_weight(const Matches& matches, const Match& marker) {
    std::set<std::string> distinct;
    for (const auto& match : matches.range(marker.start, marker.end)) {
        distinct.insert(match.name);
    }
    return distinct.size();
}

std::vector<Match> sorted_fileparts(const Matches& matches) {
    auto fileparts = matches.markers(names::kPath);
    if (fileparts.empty()) {
        fileparts.push_back(make_match(matches.input_string(), 0, matches.max_end(), names::kPath));
    }
    std::stable_sort(fileparts.begin(), fileparts.end(),
                     [&matches](const Match& a, const Match& b) {
                         return marker_weight(matches, a) > marker_weight(matches, b);
                     });
    return fileparts;
}

void merge(Consequence& into, Consequence&& from) {
    into.remove.insert(into.remove.end(), from.remove.begin(), from.remove.end());
    into.append.insert(into.append.end(), from.append.begin(), from.append.end());
}

}  // namespace

TitleBaseRule::TitleBaseRule(
    EngineConfig config, std::string match_name, std::vector<std::string> match_tags,
    std::string alternative_match_name)
    : config_(std::move(config)),
      match_name_(std::move(match_name)),
      match_tags_(std::move(match_tags)),
      alternative_match_name_(std::move(alternative_match_name)) {}

bool TitleBaseRule::hole_filter(const Match&, const Match&, const Matches&) const {
    return true;
}

bool TitleBaseRule::filepart_filter(const Match&, const Matches&) const {
    return true;
}

std::vector<std::string> TitleBaseRule::ignored_names() const {
    return {names::kLanguage, names::kCountry};
}

KeepDecision TitleBaseRule::should_keep(
    const Match& match, const std::vector<Match>& to_keep, const Matches& matches,
    const Match& filepart, const Match& hole, bool starting) const {
    if (match.name != names::kLanguage && match.name != names::kCountry) {
        return {};
    }

    if (hole.value.size() == match.length()) {
        return {true, true};
    }

    // Other matches of the same name in the segment, outside the hole.
    auto others = matches.range(filepart.start, hole.start, NameIs{match.name});
    auto after = matches.range(hole.end, filepart.end, NameIs{match.name});
    others.insert(others.end(), after.begin(), after.end());
    const bool has_others = std::any_of(others.begin(), others.end(),
                                        [&to_keep](const Match& m) { return !contains(to_keep, m); });
    if (!has_others && (!starting || match.length() <= 3)) {
        return {true, true};
    }
    return {};
}

std::optional<Consequence> TitleBaseRule::check_titles_in_filepart(
    const Match& filepart, const Matches& matches) const {
    const auto formatter = formatters::title_formatter();
    const NameIn ignored_predicate{ignored_names()};

    HoleOptions options;
    options.formatter = formatter;
    options.ignore = ignored_predicate;

    const auto groups = matches.markers(names::kGroup);
    std::vector<Match> holes;
    for (const auto& hole : matches.holes(filepart.start, filepart.end, options)) {
        for (auto& piece : matches.crop(hole, groups, formatter)) {
            if (!piece.value.empty()) {
                holes.push_back(std::move(piece));
            }
        }
    }

    for (auto hole : holes) {
        if (!hole_filter(hole, filepart, matches)) {
            continue;
        }

        std::vector<Match> to_keep;
        const auto ignored = matches.range(hole.start, hole.end, ignored_predicate);

        // Ignored matches trailing the hole, nearest to its end first.
        for (auto it = ignored.rbegin(); it != ignored.rend(); ++it) {
            if (matches.chain_before(hole.end, config_.seps, IsMatch{*it}).empty()) {
                continue;
            }
            const auto decision = should_keep(*it, to_keep, matches, filepart, hole, false);
            if (decision.append) {
                to_keep.push_back(*it);
            }
            if (decision.crop) {
                hole.end = std::max(hole.start, it->start);
                hole.value = matches.format(hole.start, hole.end, formatter);
            }
        }

        // Ignored matches leading the hole.
        for (const auto& ignored_match : ignored) {
            if (contains(to_keep, ignored_match) ||
                matches.chain_after(hole.start, config_.seps, IsMatch{ignored_match}).empty()) {
                continue;
            }
            const auto decision =
                should_keep(ignored_match, to_keep, matches, filepart, hole, true);
            if (decision.append) {
                to_keep.push_back(ignored_match);
            }
            if (decision.crop) {
                hole.start = std::min(hole.end, ignored_match.end);
                hole.value = matches.format(hole.start, hole.end, formatter);
            }
        }

        hole.value = matches.format(hole.start, hole.end, formatter);
        if (hole.value.empty()) {
            continue;
        }

        Consequence consequence;
        for (const auto& ignored_match : ignored) {
            if (!contains(to_keep, ignored_match)) {
                consequence.remove.push_back(ignored_match);
            }
        }

        hole.name = match_name_;
        hole.tags = match_tags_;
        if (alternative_match_name_.empty()) {
            consequence.append.push_back(hole);
        } else {
            consequence.append = split_titles(hole, matches);
        }
        return consequence;
    }

    return std::nullopt;
}

std::vector<Match> TitleBaseRule::split_titles(const Match& hole, const Matches& matches) const {
    const auto formatter = formatters::title_formatter();
    const std::string& input = matches.input_string();

    std::vector<Match> titles;
    for (auto& piece : matches.split(hole, config_.title_seps, formatter)) {
        if (titles.empty()) {
            titles.push_back(std::move(piece));
            continue;
        }

        // A lone dash between two words is part of the title ("Spider-Man").
        Match& previous = titles.back();
        const auto separator = input.substr(previous.end, piece.start - previous.end);
        if (separator == "-" && !formatters::is_one_of(input[previous.end - 1], config_.seps) &&
            !formatters::is_one_of(input[piece.start], config_.seps)) {
            previous.end = piece.end;
            previous.value = matches.format(previous.start, previous.end, formatter);
        } else {
            piece.name = alternative_match_name_;
            titles.push_back(std::move(piece));
        }
    }
    return titles;
}

Consequence TitleBaseRule::when(const Matches& matches) const {
    std::vector<Match> fileparts;
    for (const auto& filepart : sorted_fileparts(matches)) {
        if (filepart_filter(filepart, matches)) {
            fileparts.push_back(filepart);
        }
    }

    // Segments holding a year are always searched for a title.
    std::vector<Match> year_fileparts;
    for (const auto& filepart : fileparts) {
        if (!matches.range(filepart.start, filepart.end, NameIs{names::kYear}).empty()) {
            year_fileparts.push_back(filepart);
        }
    }

    Consequence result;
    for (const auto& filepart : fileparts) {
        year_fileparts.erase(
            std::remove(year_fileparts.begin(), year_fileparts.end(), filepart),
            year_fileparts.end());
        if (auto found = check_titles_in_filepart(filepart, matches)) {
            merge(result, std::move(*found));
            break;
        }
    }

    for (const auto& filepart : year_fileparts) {
        if (auto found = check_titles_in_filepart(filepart, matches)) {
            merge(result, std::move(*found));
        }
    }

    return result;
}

TitleFromPosition::TitleFromPosition(EngineConfig config)
    : TitleBaseRule(std::move(config), names::kTitle, {names::kTitle}, names::kAlternativeTitle) {}

Consequence TitleFromPosition::when(const Matches& matches) const {
    if (!matches.named(names::kTitle).empty()) {
        return {};
    }
    return TitleBaseRule::when(matches);
}

}  // namespace episode_title
