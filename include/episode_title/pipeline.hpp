#pragma once

/// @file pipeline.hpp
/// @brief Rule dependency graph and sequential rule pipeline

#include <episode_title/config.hpp>
#include <episode_title/match/matches.hpp>
#include <episode_title/rules/rule.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace episode_title {

/// @brief Directed acyclic graph of rules keyed by rule id
///
/// Edges come from each rule's declared dependencies and from add_edge.
/// Dependencies on rules that are not in the graph are ignored.
class RuleGraph {
public:
    /// @throws RuleGraphError if a rule with the same id was already added
    void add_rule(std::unique_ptr<Rule> rule);

    /// @brief Requires `before` to run before `after`
    ///
    /// @throws RuleGraphError if either id is not in the graph
    void add_edge(const std::string& before, const std::string& after);

    [[nodiscard]] bool has_rule(const std::string& id) const;
    [[nodiscard]] std::size_t size() const { return rules_.size(); }

    /// @brief Returns the rules in execution order
    ///
    /// Topological order; rules without an ordering constraint between them
    /// keep the order in which they were added.
    ///
    /// @throws RuleGraphError on a dependency cycle
    [[nodiscard]] std::vector<const Rule*> resolve() const;

private:
    [[nodiscard]] std::size_t index_of(const std::string& id) const;

    std::vector<std::unique_ptr<Rule>> rules_;
    std::vector<std::pair<std::string, std::string>> edges_;
};

/// @brief What one rule did during a run
struct RuleOutcome {
    std::string rule;
    bool fired = false;
    std::size_t appended = 0;
    std::size_t removed = 0;
    std::size_t relabeled = 0;
};

/// @brief Per-rule outcomes of a run, in execution order
struct RunReport {
    std::vector<RuleOutcome> outcomes;

    /// @brief Returns true if the rule changed the collection
    [[nodiscard]] bool fired(const std::string& rule) const;
};

/// @brief Runs a resolved rule graph over a match collection
class Pipeline {
public:
    /// @throws RuleGraphError on a dependency cycle
    explicit Pipeline(RuleGraph graph);

    /// @brief Returns the rule ids in execution order
    [[nodiscard]] const std::vector<std::string>& order() const { return ids_; }

    /// @brief Applies every rule once, in order
    RunReport run(Matches& matches) const;

private:
    RuleGraph graph_;
    std::vector<const Rule*> order_;
    std::vector<std::string> ids_;
};

/// @brief Builds the episode title pipeline described by `config`
///
/// Sets the library log level from the configuration.
///
/// @throws ConfigError if the configuration is invalid
[[nodiscard]] Pipeline make_pipeline(const EngineConfig& config = default_config());

}  // namespace episode_title
