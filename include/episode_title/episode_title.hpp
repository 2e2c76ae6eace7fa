#pragma once

/// @file episode_title.hpp
/// @brief Main header for the episode_title C++ library
///
/// This is the unified include for all episode_title functionality.
/// Include this single header to access matches, rules, the pipeline, etc.

#include <episode_title/config.hpp>
#include <episode_title/errors.hpp>
#include <episode_title/logging.hpp>
#include <episode_title/match/match.hpp>
#include <episode_title/match/matches.hpp>
#include <episode_title/match/predicate.hpp>
#include <episode_title/pipeline.hpp>
#include <episode_title/rules/episode_title.hpp>
#include <episode_title/rules/registry.hpp>
#include <episode_title/rules/rule.hpp>
#include <episode_title/rules/title_base.hpp>
#include <episode_title/text/formatters.hpp>

/// @namespace episode_title
/// @brief The episode_title library namespace
///
/// Contains the match collection, the episode title disambiguation rules
/// and the pipeline running them over a file name.
namespace episode_title {

/// Library version string
constexpr const char* kVersion = "1.0.0";

/// Library version as integers
constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

}  // namespace episode_title
