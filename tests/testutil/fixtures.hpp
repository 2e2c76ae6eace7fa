// Builders for match collections used by the tests
#pragma once

#include <episode_title/match/matches.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace episode_title::testutil {

// One match located by its text in the input string
struct SpanSpec {
    std::string name;
    std::string text;
    std::vector<std::string> tags = {};
    std::size_t occurrence = 0;
};

// Returns the offset of the n-th occurrence of `text` in `input`
inline std::size_t find_offset(const std::string& input, const std::string& text,
                               std::size_t occurrence) {
    std::size_t pos = input.find(text);
    for (std::size_t i = 0; i < occurrence && pos != std::string::npos; ++i) {
        pos = input.find(text, pos + 1);
    }
    if (pos == std::string::npos) {
        throw std::runtime_error("'" + text + "' not found in '" + input + "'");
    }
    return pos;
}

inline Match span(const std::string& input, const SpanSpec& spec) {
    const auto start = find_offset(input, spec.text, spec.occurrence);
    return make_match(input, start, start + spec.text.size(), spec.name, spec.tags);
}

// Builds a collection with one path marker per path segment
inline Matches build(const std::string& input, const std::vector<SpanSpec>& specs) {
    Matches matches(input);
    add_path_markers(matches);
    for (const auto& spec : specs) {
        matches.append(span(input, spec));
    }
    return matches;
}

// Builds a collection from a scenario "input" object:
// {"string": ..., "matches": [{"name", "text", "occurrence"?, "tags"?}], "groups": [text...]}
inline Matches build(const nlohmann::json& input) {
    const auto string = input.at("string").get<std::string>();
    std::vector<SpanSpec> specs;
    for (const auto& item : input.value("matches", nlohmann::json::array())) {
        SpanSpec spec;
        spec.name = item.at("name").get<std::string>();
        spec.text = item.at("text").get<std::string>();
        spec.tags = item.value("tags", std::vector<std::string>{});
        spec.occurrence = item.value("occurrence", std::size_t{0});
        specs.push_back(std::move(spec));
    }

    auto matches = build(string, specs);
    for (const auto& group : input.value("groups", nlohmann::json::array())) {
        matches.add_marker(span(string, {names::kGroup, group.get<std::string>()}));
    }
    return matches;
}

// (name, value) pairs in document order
inline std::vector<std::pair<std::string, std::string>> names_and_values(const Matches& matches) {
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& match : matches.all()) {
        result.emplace_back(match.name, match.value);
    }
    return result;
}

}  // namespace episode_title::testutil
