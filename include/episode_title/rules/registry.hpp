#pragma once

/// @file registry.hpp
/// @brief Rule factory registry

#include <episode_title/config.hpp>
#include <episode_title/rules/rule.hpp>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace episode_title {

/// @brief Factory function type for creating rules
using RuleFactoryFunc = std::function<std::unique_ptr<Rule>(const EngineConfig& config)>;

/// @brief Singleton registry for rule factories
///
/// The built-in rules are registered when the registry is first used.
class RuleRegistry {
public:
    /// @brief Returns the singleton instance
    static RuleRegistry& instance();

    /// @brief Registers a rule factory, replacing any factory with the same id
    void register_rule(const std::string& id, RuleFactoryFunc factory);

    /// @brief Creates a rule by id
    ///
    /// @throws RuleGraphError if no factory is registered under `id`
    [[nodiscard]] std::unique_ptr<Rule> create(
        const std::string& id, const EngineConfig& config) const;

    /// @brief Checks if a rule is registered
    [[nodiscard]] bool has_rule(const std::string& id) const;

    /// @brief Returns all registered rule ids, sorted
    [[nodiscard]] std::vector<std::string> registered_rules() const;

private:
    RuleRegistry();
    std::unordered_map<std::string, RuleFactoryFunc> factories_;
};

/// @brief Convenience function to create a rule
[[nodiscard]] inline std::unique_ptr<Rule> create_rule(
    const std::string& id, const EngineConfig& config) {
    return RuleRegistry::instance().create(id, config);
}

}  // namespace episode_title
