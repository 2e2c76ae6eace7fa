#pragma once

/// @file errors.hpp
/// @brief Error types and exception classes for the episode_title library

#include <cstddef>
#include <exception>
#include <string>

namespace episode_title {

/// @brief Error codes for categorizing errors
enum class ErrorCode {
    None = 0,
    InvalidSpan,
    DuplicateRule,
    UnknownRule,
    RuleCycle,
    InvalidConfig
};

/// @brief Returns a stable name for an error code
[[nodiscard]] std::string to_string(ErrorCode code);

/// @brief Base exception class for all episode_title errors
class EpisodeTitleError : public std::exception {
public:
    explicit EpisodeTitleError(std::string message, ErrorCode code = ErrorCode::None)
        : message_(std::move(message)), code_(code) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

protected:
    std::string message_;
    ErrorCode code_;
};

/// @brief A span that cannot be stored in a match collection
class SpanError : public EpisodeTitleError {
public:
    SpanError(std::size_t start, std::size_t end, std::size_t input_length)
        : EpisodeTitleError(format_message(start, end, input_length), ErrorCode::InvalidSpan),
          start_(start),
          end_(end),
          input_length_(input_length) {}

    [[nodiscard]] std::size_t start() const noexcept { return start_; }
    [[nodiscard]] std::size_t end() const noexcept { return end_; }
    [[nodiscard]] std::size_t input_length() const noexcept { return input_length_; }

private:
    static std::string format_message(std::size_t start, std::size_t end, std::size_t length) {
        std::string msg =
            "invalid span [" + std::to_string(start) + ", " + std::to_string(end) + ")";
        if (start > end) {
            return msg + ": start is after end";
        }
        return msg + ": input has " + std::to_string(length) + " characters";
    }

    std::size_t start_;
    std::size_t end_;
    std::size_t input_length_;
};

/// @brief Rule graph construction or resolution error
class RuleGraphError : public EpisodeTitleError {
public:
    RuleGraphError(std::string rule, std::string details, ErrorCode code)
        : EpisodeTitleError(format_message(rule, details), code),
          rule_(std::move(rule)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& rule() const noexcept { return rule_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& rule, const std::string& details) {
        if (!rule.empty()) {
            return "rule '" + rule + "': " + details;
        }
        return "rule graph: " + details;
    }

    std::string rule_;
    std::string details_;
};

/// @brief Configuration error
class ConfigError : public EpisodeTitleError {
public:
    ConfigError(std::string field, std::string details)
        : EpisodeTitleError(format_message(field, details), ErrorCode::InvalidConfig),
          field_(std::move(field)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& field, const std::string& details) {
        if (!field.empty()) {
            return "invalid configuration for '" + field + "': " + details;
        }
        return "invalid configuration: " + details;
    }

    std::string field_;
    std::string details_;
};

}  // namespace episode_title
