#include <episode_title/rules/registry.hpp>

#include <episode_title/errors.hpp>
#include <episode_title/rules/episode_title.hpp>
#include <episode_title/rules/title_base.hpp>

#include <algorithm>

namespace episode_title {

RuleRegistry& RuleRegistry::instance() {
    static RuleRegistry instance;
    return instance;
}

RuleRegistry::RuleRegistry() {
    register_rule("TitleFromPosition", [](const EngineConfig& config) {
        return std::make_unique<TitleFromPosition>(config);
    });
    register_rule("TitleToEpisodeTitle", [](const EngineConfig&) {
        return std::make_unique<TitleToEpisodeTitle>();
    });
    register_rule("EpisodeTitleFromPosition", [](const EngineConfig& config) {
        return std::make_unique<EpisodeTitleFromPosition>(config);
    });
    register_rule("AlternativeTitleReplace", [](const EngineConfig& config) {
        return std::make_unique<AlternativeTitleReplace>(config);
    });
    register_rule("Filepart3EpisodeTitle", [](const EngineConfig& config) {
        return std::make_unique<Filepart3EpisodeTitle>(config);
    });
    register_rule("Filepart2EpisodeTitle", [](const EngineConfig& config) {
        return std::make_unique<Filepart2EpisodeTitle>(config);
    });
}

void RuleRegistry::register_rule(const std::string& id, RuleFactoryFunc factory) {
    factories_[id] = std::move(factory);
}

std::unique_ptr<Rule> RuleRegistry::create(const std::string& id, const EngineConfig& config) const {
    auto it = factories_.find(id);
    if (it == factories_.end()) {
        throw RuleGraphError(id, "no such rule is registered", ErrorCode::UnknownRule);
    }
    return it->second(config);
}

bool RuleRegistry::has_rule(const std::string& id) const {
    return factories_.find(id) != factories_.end();
}

std::vector<std::string> RuleRegistry::registered_rules() const {
    std::vector<std::string> ids;
    ids.reserve(factories_.size());
    for (const auto& [id, _] : factories_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace episode_title
