#pragma once

/// @file match.hpp
/// @brief Tagged span over the normalized file name

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace episode_title {

/// @brief Property names used by the episode title rules
namespace names {
constexpr const char* kTitle = "title";
constexpr const char* kEpisodeTitle = "episodeTitle";
constexpr const char* kAlternativeTitle = "alternativeTitle";
constexpr const char* kEpisodeNumber = "episodeNumber";
constexpr const char* kEpisodeCount = "episodeCount";
constexpr const char* kEpisodeDetails = "episodeDetails";
constexpr const char* kSeason = "season";
constexpr const char* kSeasonCount = "seasonCount";
constexpr const char* kDate = "date";
constexpr const char* kYear = "year";
constexpr const char* kCrc32 = "crc32";
constexpr const char* kLanguage = "language";
constexpr const char* kCountry = "country";

/// Marker names
constexpr const char* kPath = "path";
constexpr const char* kGroup = "group";
}  // namespace names

/// @brief A tagged, offset-addressed substring of the input string
struct Match {
    /// Start offset (inclusive)
    std::size_t start = 0;
    /// End offset (exclusive)
    std::size_t end = 0;
    /// Property name (e.g., "title", "episodeNumber")
    std::string name;
    /// Extracted, possibly formatted, value
    std::string value;
    /// Auxiliary tags (e.g., "title" on every title-like match)
    std::vector<std::string> tags;

    [[nodiscard]] std::size_t length() const { return end > start ? end - start : 0; }

    /// Returns true if the span covers `index`
    [[nodiscard]] bool covers(std::size_t index) const { return start <= index && index < end; }

    [[nodiscard]] bool has_tag(std::string_view tag) const;

    bool operator==(const Match& other) const;
    bool operator!=(const Match& other) const { return !(*this == other); }
};

/// @brief Builds a match whose value is the raw text of the span
[[nodiscard]] Match make_match(
    std::string_view input, std::size_t start, std::size_t end, std::string name,
    std::vector<std::string> tags = {});

/// @brief Serialization for Match
void to_json(nlohmann::json& j, const Match& m);
void from_json(const nlohmann::json& j, Match& m);

}  // namespace episode_title
