#include <episode_title/config.hpp>

#include <episode_title/errors.hpp>
#include <episode_title/match/match.hpp>
#include <episode_title/text/formatters.hpp>

#include <algorithm>
#include <fstream>

#include <spdlog/common.h>

namespace episode_title {

std::string to_string(FilepartPlacement placement) {
    switch (placement) {
    case FilepartPlacement::BeforeChain:
        return "before_chain";
    case FilepartPlacement::AfterChain:
        return "after_chain";
    }
    return "before_chain";
}

FilepartPlacement parse_filepart_placement(const std::string& value) {
    if (value == "before_chain") return FilepartPlacement::BeforeChain;
    if (value == "after_chain") return FilepartPlacement::AfterChain;
    throw ConfigError("filepart_placement", "unknown placement '" + value + "'");
}

EngineConfig default_config() {
    EngineConfig config;
    config.seps = std::string(formatters::kSeps);
    config.title_seps = std::string(formatters::kTitleSeps);
    config.episode_anchors = {names::kEpisodeNumber, names::kEpisodeDetails,
                              names::kEpisodeCount,  names::kSeason,
                              names::kSeasonCount,   names::kDate,
                              names::kTitle};
    config.filepart_placement = FilepartPlacement::BeforeChain;
    config.title_from_position = true;
    config.log_level = "warn";
    return config;
}

void validate_config(const EngineConfig& config) {
    if (config.seps.empty()) {
        throw ConfigError("seps", "must not be empty");
    }
    if (config.title_seps.empty()) {
        throw ConfigError("title_seps", "must not be empty");
    }
    if (config.episode_anchors.empty()) {
        throw ConfigError("episode_anchors", "must name at least one match");
    }
    if (std::any_of(config.episode_anchors.begin(), config.episode_anchors.end(),
                    [](const std::string& anchor) { return anchor.empty(); })) {
        throw ConfigError("episode_anchors", "contains an empty name");
    }
    // spdlog maps unknown names to "off"; only accept that when spelled out.
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        throw ConfigError("log_level", "unknown level '" + config.log_level + "'");
    }
}

EngineConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("", "failed to open " + path.string());
    }

    EngineConfig config = default_config();
    try {
        auto j = nlohmann::json::parse(file);
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("", path.string() + ": " + e.what());
    }

    validate_config(config);
    return config;
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"seps", c.seps},
        {"title_seps", c.title_seps},
        {"episode_anchors", c.episode_anchors},
        {"filepart_placement", to_string(c.filepart_placement)},
        {"title_from_position", c.title_from_position},
        {"log_level", c.log_level}};
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("seps")) j.at("seps").get_to(c.seps);
    if (j.contains("title_seps")) j.at("title_seps").get_to(c.title_seps);
    if (j.contains("episode_anchors")) j.at("episode_anchors").get_to(c.episode_anchors);
    if (j.contains("filepart_placement")) {
        c.filepart_placement = parse_filepart_placement(j.at("filepart_placement").get<std::string>());
    }
    if (j.contains("title_from_position")) j.at("title_from_position").get_to(c.title_from_position);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
}

EngineConfig make_config(const std::vector<ConfigOption>& options) {
    EngineConfig config = default_config();
    for (const auto& option : options) {
        option(config);
    }
    return config;
}

ConfigOption with_separators(const std::string& seps, const std::string& title_seps) {
    return [seps, title_seps](EngineConfig& c) {
        c.seps = seps;
        c.title_seps = title_seps;
    };
}

ConfigOption with_episode_anchors(const std::vector<std::string>& anchors) {
    return [anchors](EngineConfig& c) { c.episode_anchors = anchors; };
}

ConfigOption with_filepart_placement(FilepartPlacement placement) {
    return [placement](EngineConfig& c) { c.filepart_placement = placement; };
}

ConfigOption without_title_from_position() {
    return [](EngineConfig& c) { c.title_from_position = false; };
}

ConfigOption with_log_level(const std::string& level) {
    return [level](EngineConfig& c) { c.log_level = level; };
}

}  // namespace episode_title
