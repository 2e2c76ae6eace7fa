#include <episode_title/text/formatters.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace episode_title {
namespace formatters {

namespace {

// Separators that cleanup() leaves untouched
constexpr std::string_view kKeptByCleanup = ",:;-/\\";

const std::vector<std::string> kArticles = {"the"};
const std::vector<std::string> kArticleSeparators = {",", ", "};

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_sep(char c) {
    return is_one_of(c, kSeps);
}

// A separator directly after a single character, itself preceded by a separator
// or the start of the string: the "." after "S" in " S.H".
bool potential_before(std::size_t i, std::string_view input) {
    if (i < 1 || !is_sep(input[i]) || is_sep(input[i - 1])) {
        return false;
    }
    return i < 2 || is_sep(input[i - 2]);
}

bool potential_after(std::size_t i, std::string_view input) {
    if (i + 2 >= input.size()) {
        return true;
    }
    return input[i + 2] == input[i] && !is_sep(input[i + 1]);
}

std::string collapse_spaces(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (c == ' ' && !result.empty() && result.back() == ' ') {
            continue;
        }
        result.push_back(c);
    }
    return result;
}

}  // namespace

std::string strip(std::string_view input, std::string_view chars) {
    const auto start = input.find_first_not_of(chars);
    if (start == std::string_view::npos) return "";
    const auto end = input.find_last_not_of(chars);
    return std::string(input.substr(start, end - start + 1));
}

std::string cleanup(std::string_view input) {
    std::string clean(input);
    for (auto& c : clean) {
        if (is_sep(c) && !is_one_of(c, kKeptByCleanup)) {
            c = ' ';
        }
    }

    std::vector<std::size_t> potential;
    for (std::size_t i = 0; i < clean.size(); ++i) {
        if (is_sep(clean[i]) && potential_before(i, input) && potential_after(i, input)) {
            potential.push_back(i);
        }
    }

    // Restore separators that sit between single characters on both sides.
    std::set<char> dots;
    auto is_potential = [&potential](std::size_t index) {
        return std::binary_search(potential.begin(), potential.end(), index);
    };
    for (auto index : potential) {
        if ((index >= 2 && is_potential(index - 2)) || is_potential(index + 2)) {
            dots.insert(input[index]);
            clean[index] = input[index];
        }
    }

    std::string strip_chars;
    for (char c : kSeps) {
        if (dots.count(c) == 0) {
            strip_chars.push_back(c);
        }
    }

    return collapse_spaces(strip(clean, strip_chars));
}

std::string reorder_title(std::string_view title) {
    const std::string lower = to_lower(title);
    for (const auto& article : kArticles) {
        for (const auto& separator : kArticleSeparators) {
            const std::string suffix = separator + article;
            if (lower.size() < suffix.size() ||
                lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }
            std::string result(title.substr(title.size() - article.size()));
            result += ' ';
            result += title.substr(0, title.size() - suffix.size());
            return result;
        }
    }
    return std::string(title);
}

Formatter compose(std::vector<Formatter> chain) {
    return [chain = std::move(chain)](std::string_view input) {
        std::string value(input);
        for (const auto& formatter : chain) {
            value = formatter(value);
        }
        return value;
    };
}

Formatter title_formatter() {
    return compose({cleanup, reorder_title});
}

}  // namespace formatters
}  // namespace episode_title
