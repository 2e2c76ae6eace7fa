#include <episode_title/errors.hpp>

namespace episode_title {

std::string to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::InvalidSpan:
        return "invalid_span";
    case ErrorCode::DuplicateRule:
        return "duplicate_rule";
    case ErrorCode::UnknownRule:
        return "unknown_rule";
    case ErrorCode::RuleCycle:
        return "rule_cycle";
    case ErrorCode::InvalidConfig:
        return "invalid_config";
    }
    return "unknown";
}

}  // namespace episode_title
