#include <episode_title/rules/rule.hpp>

#include <episode_title/logging.hpp>

namespace episode_title {

void apply_consequence(Matches& matches, const Consequence& consequence) {
    for (const auto& match : consequence.remove) {
        if (!matches.remove(match)) {
            logger()->debug("match '{}' [{}, {}) already removed", match.name, match.start,
                            match.end);
        }
    }
    for (const auto& relabel : consequence.relabel) {
        if (!matches.relabel(relabel.match, relabel.name)) {
            logger()->debug("cannot relabel missing match '{}' [{}, {})", relabel.match.name,
                            relabel.match.start, relabel.match.end);
        }
    }
    for (const auto& match : consequence.append) {
        matches.append(match);
    }
}

}  // namespace episode_title
