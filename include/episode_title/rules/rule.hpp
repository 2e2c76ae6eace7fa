#pragma once

/// @file rule.hpp
/// @brief Rule interface shared by every disambiguation rule

#include <episode_title/match/matches.hpp>

#include <string>
#include <vector>

namespace episode_title {

/// @brief A match to rename, keeping its span, value and tags
struct Relabel {
    Match match;
    std::string name;
};

/// @brief Mutations a rule wants applied to the match collection
///
/// An empty consequence means the rule does not apply.
struct Consequence {
    std::vector<Match> remove;
    std::vector<Relabel> relabel;
    std::vector<Match> append;

    [[nodiscard]] bool empty() const {
        return remove.empty() && relabel.empty() && append.empty();
    }
};

/// @brief Abstract interface that all rules must implement
///
/// A rule inspects the collection in `when` without touching it; the
/// returned consequence is applied afterwards by apply_consequence.
class Rule {
public:
    virtual ~Rule() = default;

    /// @brief Returns the rule identifier (e.g., "TitleToEpisodeTitle")
    [[nodiscard]] virtual std::string id() const = 0;

    /// @brief Returns the ids of rules that must run before this one
    [[nodiscard]] virtual std::vector<std::string> dependencies() const { return {}; }

    /// @brief Computes the mutations this rule makes to `matches`
    [[nodiscard]] virtual Consequence when(const Matches& matches) const = 0;
};

/// @brief Applies a consequence: removals, then relabels, then appends
///
/// @throws SpanError if an appended match has an invalid span
void apply_consequence(Matches& matches, const Consequence& consequence);

}  // namespace episode_title
