#include <episode_title/match/matches.hpp>

#include <episode_title/errors.hpp>

#include <algorithm>

namespace episode_title {

namespace {

bool document_order(const Match& a, const Match& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
}

void push_unique(std::vector<Match>& chain, const Match& match) {
    if (std::find(chain.begin(), chain.end(), match) == chain.end()) {
        chain.push_back(match);
    }
}

}  // namespace

std::optional<Match> nth(const std::vector<Match>& matches, std::size_t index) {
    if (index < matches.size()) {
        return matches[index];
    }
    return std::nullopt;
}

Matches::Matches(std::string input_string) : input_string_(std::move(input_string)) {}

std::size_t Matches::max_end() const {
    std::size_t result = input_string_.size();
    for (const auto& match : matches_) {
        result = std::max(result, match.end);
    }
    return result;
}

void Matches::check_span(const Match& match) const {
    if (match.start > match.end ||
        (!input_string_.empty() && match.end > input_string_.size())) {
        throw SpanError(match.start, match.end, input_string_.size());
    }
}

void Matches::append(Match match) {
    check_span(match);
    auto pos = std::upper_bound(matches_.begin(), matches_.end(), match, document_order);
    matches_.insert(pos, std::move(match));
}

bool Matches::remove(const Match& match) {
    auto it = std::find(matches_.begin(), matches_.end(), match);
    if (it == matches_.end()) {
        return false;
    }
    matches_.erase(it);
    return true;
}

bool Matches::relabel(const Match& match, const std::string& name) {
    auto it = std::find(matches_.begin(), matches_.end(), match);
    if (it == matches_.end()) {
        return false;
    }
    Match renamed = *it;
    renamed.name = name;
    matches_.erase(it);
    auto pos = std::upper_bound(matches_.begin(), matches_.end(), renamed, document_order);
    matches_.insert(pos, std::move(renamed));
    return true;
}

void Matches::add_marker(Match marker) {
    check_span(marker);
    auto pos = std::upper_bound(markers_.begin(), markers_.end(), marker, document_order);
    markers_.insert(pos, std::move(marker));
}

std::vector<Match> Matches::markers(std::string_view name) const {
    std::vector<Match> result;
    for (const auto& marker : markers_) {
        if (marker.name == name) {
            result.push_back(marker);
        }
    }
    return result;
}

std::vector<Match> Matches::filter(
    const std::vector<Match>& matches, const Predicate& predicate) const {
    std::vector<Match> result;
    for (const auto& match : matches) {
        if (evaluate(predicate, match)) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::named(std::string_view name, const Predicate& predicate) const {
    std::vector<Match> result;
    for (const auto& match : matches_) {
        if (match.name == name && evaluate(predicate, match)) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::starting(std::size_t index) const {
    std::vector<Match> result;
    for (const auto& match : matches_) {
        if (match.start == index) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::ending(std::size_t index) const {
    std::vector<Match> result;
    for (const auto& match : matches_) {
        if (match.end == index) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::at_index(std::size_t index) const {
    std::vector<Match> result;
    for (const auto& match : matches_) {
        if (match.covers(index)) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::previous(
    const Match& match, const Predicate& predicate, std::size_t floor) const {
    if (match.start < floor) {
        return {};
    }
    for (std::size_t current = match.start + 1; current-- > floor;) {
        std::vector<Match> candidates;
        for (const auto& other : ending(current)) {
            if (other != match) {
                candidates.push_back(other);
            }
        }
        if (!candidates.empty()) {
            return filter(candidates, predicate);
        }
    }
    return {};
}

std::vector<Match> Matches::next(
    const Match& match, const Predicate& predicate, std::size_t ceiling) const {
    const std::size_t last = std::min(ceiling, max_end());
    for (std::size_t current = match.end; current <= last; ++current) {
        std::vector<Match> candidates;
        for (const auto& other : starting(current)) {
            if (other != match) {
                candidates.push_back(other);
            }
        }
        if (!candidates.empty()) {
            return filter(candidates, predicate);
        }
    }
    return {};
}

std::vector<Match> Matches::range(
    std::size_t start, std::size_t end, const Predicate& predicate) const {
    std::vector<Match> result;
    for (const auto& match : matches_) {
        if (match.start >= start && match.end <= end && evaluate(predicate, match)) {
            result.push_back(match);
        }
    }
    return result;
}

std::vector<Match> Matches::holes(
    std::size_t start, std::size_t end, const HoleOptions& options) const {
    end = std::min(end, max_end());

    std::vector<Match> holes;
    bool open = false;
    for (std::size_t index = start; index < end; ++index) {
        bool covered = false;
        for (const auto& match : matches_) {
            if (match.covers(index) && !(options.ignore && evaluate(*options.ignore, match))) {
                covered = true;
                break;
            }
        }

        const bool at_sep = !options.seps.empty() && index < input_string_.size() &&
                            formatters::is_one_of(input_string_[index], options.seps);
        if (open && at_sep) {
            open = false;
            holes.back().end = index;
        } else if (!covered && !open) {
            open = true;
            Match hole;
            hole.start = index;
            holes.push_back(hole);
        } else if (covered && open) {
            open = false;
            holes.back().end = index;
        }
    }
    if (open) {
        holes.back().end = end;
    }

    std::vector<Match> result;
    for (auto& hole : holes) {
        hole.value = format(hole.start, hole.end, options.formatter);
        if (evaluate(options.predicate, hole)) {
            result.push_back(std::move(hole));
        }
    }
    return result;
}

std::vector<Match> Matches::chain_before(
    std::size_t position, std::string_view seps, const Predicate& predicate,
    std::size_t start) const {
    position = std::min(position, max_end());

    std::vector<Match> chain;
    for (std::size_t index = position; index-- > start;) {
        auto found = filter(at_index(index), predicate);
        if (!found.empty()) {
            for (const auto& match : found) {
                push_unique(chain, match);
            }
        } else if (index >= input_string_.size() ||
                   !formatters::is_one_of(input_string_[index], seps)) {
            break;
        }
    }
    return chain;
}

std::vector<Match> Matches::chain_after(
    std::size_t position, std::string_view seps, const Predicate& predicate,
    std::size_t end) const {
    end = std::min(end, max_end());

    std::vector<Match> chain;
    for (std::size_t index = position; index < end; ++index) {
        auto found = filter(at_index(index), predicate);
        if (!found.empty()) {
            for (const auto& match : found) {
                push_unique(chain, match);
            }
        } else if (index >= input_string_.size() ||
                   !formatters::is_one_of(input_string_[index], seps)) {
            break;
        }
    }
    return chain;
}

std::string Matches::format(
    std::size_t start, std::size_t end, const formatters::Formatter& formatter) const {
    end = std::min(end, input_string_.size());
    if (start >= end) {
        return "";
    }
    std::string_view raw(input_string_);
    raw = raw.substr(start, end - start);
    return formatter ? formatter(raw) : std::string(raw);
}

std::vector<Match> Matches::split(
    const Match& match, std::string_view seps, const formatters::Formatter& formatter) const {
    std::vector<Match> pieces;
    auto emit = [&](std::size_t piece_start, std::size_t piece_end) {
        if (piece_start >= piece_end) return;
        Match piece = match;
        piece.start = piece_start;
        piece.end = piece_end;
        piece.value = format(piece_start, piece_end, formatter);
        if (!piece.value.empty()) {
            pieces.push_back(std::move(piece));
        }
    };

    const std::size_t end = std::min(match.end, input_string_.size());
    std::size_t piece_start = match.start;
    for (std::size_t index = match.start; index < end; ++index) {
        if (formatters::is_one_of(input_string_[index], seps)) {
            emit(piece_start, index);
            piece_start = index + 1;
        }
    }
    emit(piece_start, end);
    return pieces;
}

std::vector<Match> Matches::crop(
    const Match& match, const std::vector<Match>& by,
    const formatters::Formatter& formatter) const {
    std::vector<std::pair<std::size_t, std::size_t>> spans = {{match.start, match.end}};
    for (const auto& cropper : by) {
        std::vector<std::pair<std::size_t, std::size_t>> remaining;
        for (const auto& [start, end] : spans) {
            if (cropper.end <= start || cropper.start >= end) {
                remaining.emplace_back(start, end);
                continue;
            }
            if (cropper.start > start) {
                remaining.emplace_back(start, cropper.start);
            }
            if (cropper.end < end) {
                remaining.emplace_back(cropper.end, end);
            }
        }
        spans = std::move(remaining);
    }

    std::vector<Match> pieces;
    for (const auto& [start, end] : spans) {
        Match piece = match;
        piece.start = start;
        piece.end = end;
        piece.value = format(start, end, formatter);
        pieces.push_back(std::move(piece));
    }
    return pieces;
}

void add_path_markers(Matches& matches, std::string_view path_seps) {
    const std::string& input = matches.input_string();
    std::size_t segment_start = 0;
    for (std::size_t index = 0; index <= input.size(); ++index) {
        if (index == input.size() || formatters::is_one_of(input[index], path_seps)) {
            if (index > segment_start) {
                matches.add_marker(make_match(input, segment_start, index, names::kPath));
            }
            segment_start = index + 1;
        }
    }
}

void to_json(nlohmann::json& j, const Matches& m) {
    j = nlohmann::json{
        {"input", m.input_string()}, {"markers", m.all_markers()}, {"matches", m.all()}};
}

void from_json(const nlohmann::json& j, Matches& m) {
    m = Matches(j.value("input", std::string{}));
    auto read = [&m](const nlohmann::json& item) {
        auto match = item.get<Match>();
        if (!item.contains("value")) {
            match.value = m.format(match.start, match.end);
        }
        return match;
    };
    if (j.contains("markers")) {
        for (const auto& item : j.at("markers")) {
            m.add_marker(read(item));
        }
    }
    if (j.contains("matches")) {
        for (const auto& item : j.at("matches")) {
            m.append(read(item));
        }
    }
}

}  // namespace episode_title
