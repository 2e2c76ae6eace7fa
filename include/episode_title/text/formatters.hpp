#pragma once

/// @file formatters.hpp
/// @brief Separator sets and value formatters applied to extracted spans

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace episode_title {
namespace formatters {

/// @brief Characters separating words in a media file name
constexpr std::string_view kSeps = " [](){}+*|=-_~#/\\.,;:";

/// @brief Characters separating a title from an alternative title
constexpr std::string_view kTitleSeps = "-+/\\|";

/// @brief Transforms the raw text of a span into its value
using Formatter = std::function<std::string(std::string_view)>;

/// @brief Returns true if `c` is one of `chars`
[[nodiscard]] inline bool is_one_of(char c, std::string_view chars) {
    return chars.find(c) != std::string_view::npos;
}

/// @brief Removes leading and trailing characters found in `chars`
[[nodiscard]] std::string strip(std::string_view input, std::string_view chars);

/// @brief Turns separators into single spaces and strips the result
///
/// `,;:-/\` are left in place. Separators between single characters are
/// kept, so "Agents.of.S.H.I.E.L.D." becomes "Agents of S.H.I.E.L.D.".
///
/// @param input Raw span text
/// @return Cleaned value, possibly empty
[[nodiscard]] std::string cleanup(std::string_view input);

/// @brief Moves a trailing article to the front ("Simpsons, The" -> "The Simpsons")
[[nodiscard]] std::string reorder_title(std::string_view title);

/// @brief Applies formatters left to right
[[nodiscard]] Formatter compose(std::vector<Formatter> chain);

/// @brief Formatter used for title holes (cleanup, then reorder_title)
[[nodiscard]] Formatter title_formatter();

}  // namespace formatters
}  // namespace episode_title
