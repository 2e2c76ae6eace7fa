#include <episode_title/pipeline.hpp>

#include <episode_title/errors.hpp>
#include <episode_title/logging.hpp>
#include <episode_title/rules/registry.hpp>

#include <algorithm>

namespace episode_title {

namespace {

constexpr std::size_t kNotFound = static_cast<std::size_t>(-1);

const std::vector<std::string> kFilepartRules = {"Filepart3EpisodeTitle", "Filepart2EpisodeTitle"};

std::string join(const std::vector<std::string>& ids) {
    std::string result;
    for (const auto& id : ids) {
        if (!result.empty()) result += " -> ";
        result += id;
    }
    return result;
}

}  // namespace

void RuleGraph::add_rule(std::unique_ptr<Rule> rule) {
    const auto id = rule->id();
    if (has_rule(id)) {
        throw RuleGraphError(id, "already in the graph", ErrorCode::DuplicateRule);
    }
    rules_.push_back(std::move(rule));
}

void RuleGraph::add_edge(const std::string& before, const std::string& after) {
    for (const auto& id : {before, after}) {
        if (!has_rule(id)) {
            throw RuleGraphError(id, "not in the graph", ErrorCode::UnknownRule);
        }
    }
    edges_.emplace_back(before, after);
}

bool RuleGraph::has_rule(const std::string& id) const {
    return index_of(id) != kNotFound;
}

std::size_t RuleGraph::index_of(const std::string& id) const {
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        if (rules_[i]->id() == id) {
            return i;
        }
    }
    return kNotFound;
}

std::vector<const Rule*> RuleGraph::resolve() const {
    const std::size_t count = rules_.size();
    std::vector<std::vector<std::size_t>> successors(count);
    std::vector<std::size_t> in_degree(count, 0);

    auto link = [&](std::size_t before, std::size_t after) {
        successors[before].push_back(after);
        ++in_degree[after];
    };

    for (std::size_t i = 0; i < count; ++i) {
        for (const auto& dependency : rules_[i]->dependencies()) {
            const auto before = index_of(dependency);
            if (before == kNotFound) {
                logger()->debug("rule {} depends on absent rule {}", rules_[i]->id(), dependency);
                continue;
            }
            link(before, i);
        }
    }
    for (const auto& [before, after] : edges_) {
        link(index_of(before), index_of(after));
    }

    std::vector<const Rule*> order;
    std::vector<bool> done(count, false);
    while (order.size() < count) {
        // Lowest insertion index among the rules whose predecessors all ran.
        std::size_t ready = kNotFound;
        for (std::size_t i = 0; i < count; ++i) {
            if (!done[i] && in_degree[i] == 0) {
                ready = i;
                break;
            }
        }
        if (ready == kNotFound) {
            for (std::size_t i = 0; i < count; ++i) {
                if (!done[i]) {
                    throw RuleGraphError(
                        rules_[i]->id(), "dependency cycle detected", ErrorCode::RuleCycle);
                }
            }
        }

        done[ready] = true;
        order.push_back(rules_[ready].get());
        for (auto next : successors[ready]) {
            --in_degree[next];
        }
    }
    return order;
}

bool RunReport::fired(const std::string& rule) const {
    return std::any_of(outcomes.begin(), outcomes.end(), [&rule](const RuleOutcome& outcome) {
        return outcome.rule == rule && outcome.fired;
    });
}

Pipeline::Pipeline(RuleGraph graph) : graph_(std::move(graph)), order_(graph_.resolve()) {
    ids_.reserve(order_.size());
    for (const auto* rule : order_) {
        ids_.push_back(rule->id());
    }
    logger()->debug("rule order: {}", join(ids_));
}

RunReport Pipeline::run(Matches& matches) const {
    auto log = logger();
    RunReport report;
    report.outcomes.reserve(order_.size());

    for (const auto* rule : order_) {
        const auto consequence = rule->when(matches);

        RuleOutcome outcome;
        outcome.rule = rule->id();
        outcome.fired = !consequence.empty();
        outcome.appended = consequence.append.size();
        outcome.removed = consequence.remove.size();
        outcome.relabeled = consequence.relabel.size();

        if (outcome.fired) {
            log->debug("{}: {} appended, {} removed, {} relabeled", outcome.rule,
                       outcome.appended, outcome.removed, outcome.relabeled);
            for (const auto& match : consequence.append) {
                log->trace("{}: append {} '{}' [{}, {})", outcome.rule, match.name, match.value,
                           match.start, match.end);
            }
            for (const auto& relabel : consequence.relabel) {
                log->trace("{}: relabel {} '{}' as {}", outcome.rule, relabel.match.name,
                           relabel.match.value, relabel.name);
            }
            apply_consequence(matches, consequence);
        }

        report.outcomes.push_back(std::move(outcome));
    }
    return report;
}

Pipeline make_pipeline(const EngineConfig& config) {
    validate_config(config);
    set_log_level(config.log_level);

    auto& registry = RuleRegistry::instance();
    RuleGraph graph;
    if (config.title_from_position) {
        graph.add_rule(registry.create("TitleFromPosition", config));
    }
    for (const auto& id : kFilepartRules) {
        graph.add_rule(registry.create(id, config));
    }
    graph.add_rule(registry.create("TitleToEpisodeTitle", config));
    graph.add_rule(registry.create("EpisodeTitleFromPosition", config));
    graph.add_rule(registry.create("AlternativeTitleReplace", config));

    for (const auto& id : kFilepartRules) {
        if (config.filepart_placement == FilepartPlacement::BeforeChain) {
            graph.add_edge(id, "TitleToEpisodeTitle");
        } else {
            graph.add_edge("AlternativeTitleReplace", id);
        }
    }

    return Pipeline(std::move(graph));
}

}  // namespace episode_title
