#include <episode_title/match/match.hpp>

#include <algorithm>

namespace episode_title {

bool Match::has_tag(std::string_view tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

bool Match::operator==(const Match& other) const {
    return start == other.start && end == other.end && name == other.name &&
           value == other.value && tags == other.tags;
}

Match make_match(
    std::string_view input, std::size_t start, std::size_t end, std::string name,
    std::vector<std::string> tags) {
    Match match;
    match.start = start;
    match.end = end;
    match.name = std::move(name);
    if (start < end && end <= input.size()) {
        match.value = std::string(input.substr(start, end - start));
    }
    match.tags = std::move(tags);
    return match;
}

void to_json(nlohmann::json& j, const Match& m) {
    j = nlohmann::json{{"name", m.name}, {"start", m.start}, {"end", m.end}, {"value", m.value}};
    if (!m.tags.empty()) {
        j["tags"] = m.tags;
    }
}

void from_json(const nlohmann::json& j, Match& m) {
    j.at("name").get_to(m.name);
    j.at("start").get_to(m.start);
    j.at("end").get_to(m.end);
    if (j.contains("value")) j.at("value").get_to(m.value);
    if (j.contains("tags")) j.at("tags").get_to(m.tags);
}

}  // namespace episode_title
