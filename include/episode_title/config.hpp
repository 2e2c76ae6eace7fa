#pragma once

/// @file config.hpp
/// @brief Configuration types for the episode_title library

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace episode_title {

/// @brief Where the path-segment title rules run relative to the title chain
enum class FilepartPlacement {
    /// Before TitleToEpisodeTitle, so the chain sees the inferred titles
    BeforeChain,
    /// After AlternativeTitleReplace
    AfterChain
};

[[nodiscard]] std::string to_string(FilepartPlacement placement);

/// @brief Parses "before_chain" or "after_chain"
///
/// @throws ConfigError on any other value
[[nodiscard]] FilepartPlacement parse_filepart_placement(const std::string& value);

/// @brief Main configuration for the rule pipeline
struct EngineConfig {
    /// Word separators used for chaining and cropping
    std::string seps;
    /// Separators splitting a title from an alternative title
    std::string title_seps;
    /// Match names that put a following hole or title in episode context
    std::vector<std::string> episode_anchors;
    /// Placement of Filepart3EpisodeTitle and Filepart2EpisodeTitle
    FilepartPlacement filepart_placement = FilepartPlacement::BeforeChain;
    /// Run TitleFromPosition to produce the initial title set
    bool title_from_position = true;
    /// spdlog level name ("trace", "debug", "info", "warn", "err", "critical", "off")
    std::string log_level = "warn";
};

/// @brief Returns a configuration with sensible defaults
[[nodiscard]] EngineConfig default_config();

/// @brief Checks a configuration for consistency
///
/// @throws ConfigError naming the first invalid field
void validate_config(const EngineConfig& config);

/// @brief Loads a JSON configuration file over the defaults
///
/// Keys missing from the file keep their default value.
///
/// @throws ConfigError if the file cannot be read, parsed or validated
[[nodiscard]] EngineConfig load_config(const std::filesystem::path& path);

/// @brief Serialization for EngineConfig
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

/// @brief Functional option type for configuring the pipeline
using ConfigOption = std::function<void(EngineConfig&)>;

/// @brief Applies options over the defaults
[[nodiscard]] EngineConfig make_config(const std::vector<ConfigOption>& options);

/// @brief Sets the word and title separators
[[nodiscard]] ConfigOption with_separators(const std::string& seps, const std::string& title_seps);

/// @brief Replaces the episode anchor names
[[nodiscard]] ConfigOption with_episode_anchors(const std::vector<std::string>& anchors);

/// @brief Sets where the path-segment title rules run
[[nodiscard]] ConfigOption with_filepart_placement(FilepartPlacement placement);

/// @brief Skips TitleFromPosition, for callers that provide their own titles
[[nodiscard]] ConfigOption without_title_from_position();

/// @brief Sets the log level
[[nodiscard]] ConfigOption with_log_level(const std::string& level);

}  // namespace episode_title
