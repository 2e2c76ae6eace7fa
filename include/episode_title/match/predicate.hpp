#pragma once

/// @file predicate.hpp
/// @brief Closed set of match predicates evaluated by the query surface

#include <episode_title/match/match.hpp>

#include <string>
#include <variant>
#include <vector>

namespace episode_title {

/// @brief Accepts every match
struct AnyMatch {};

/// @brief Accepts matches with the given name
struct NameIs {
    std::string name;
};

/// @brief Accepts matches whose name is one of `names`
struct NameIn {
    std::vector<std::string> names;
};

/// @brief Accepts matches carrying the given auxiliary tag
struct HasTag {
    std::string tag;
};

/// @brief Accepts only the given match
struct IsMatch {
    Match match;
};

/// @brief Accepts matches with a non-empty value
struct HasValue {};

using Predicate = std::variant<AnyMatch, NameIs, NameIn, HasTag, IsMatch, HasValue>;

/// @brief Evaluates a predicate against a match
[[nodiscard]] bool evaluate(const Predicate& predicate, const Match& match);

}  // namespace episode_title
