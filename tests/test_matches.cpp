// Tests for the match collection and its queries
#include <gtest/gtest.h>

#include <episode_title/errors.hpp>
#include <episode_title/match/matches.hpp>

#include "testutil/fixtures.hpp"

using namespace episode_title;
using namespace episode_title::testutil;

class MatchesTest : public ::testing::Test {
  protected:
    const std::string input_ = "Alpha.E05.Bravo";

    Matches sample() const {
        return build(input_, {{names::kTitle, "Alpha", {names::kTitle}},
                              {names::kEpisodeNumber, "E05"},
                              {names::kTitle, "Bravo", {names::kTitle}}});
    }
};

TEST_F(MatchesTest, AppendKeepsDocumentOrder) {
    Matches matches(input_);
    matches.append(make_match(input_, 10, 15, names::kTitle));
    matches.append(make_match(input_, 0, 5, names::kTitle));
    matches.append(make_match(input_, 6, 9, names::kEpisodeNumber));

    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches.all()[0].value, "Alpha");
    EXPECT_EQ(matches.all()[1].value, "E05");
    EXPECT_EQ(matches.all()[2].value, "Bravo");
}

TEST_F(MatchesTest, AppendRejectsInvalidSpans) {
    Matches matches(input_);

    Match reversed;
    reversed.start = 5;
    reversed.end = 2;
    EXPECT_THROW(matches.append(reversed), SpanError);

    Match too_long;
    too_long.start = 10;
    too_long.end = 16;
    try {
        matches.append(too_long);
        FAIL() << "Expected SpanError";
    } catch (const SpanError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidSpan);
        EXPECT_EQ(e.input_length(), 15u);
    }
    EXPECT_TRUE(matches.empty());
}

TEST_F(MatchesTest, RemoveAndRelabel) {
    auto matches = sample();
    auto bravo = matches.all()[2];

    EXPECT_TRUE(matches.relabel(bravo, names::kEpisodeTitle));
    auto relabeled = nth(matches.named(names::kEpisodeTitle));
    ASSERT_TRUE(relabeled.has_value());
    EXPECT_EQ(relabeled->start, bravo.start);
    EXPECT_EQ(relabeled->end, bravo.end);
    EXPECT_EQ(relabeled->value, bravo.value);
    EXPECT_EQ(relabeled->tags, bravo.tags);

    EXPECT_FALSE(matches.relabel(bravo, names::kEpisodeTitle));
    EXPECT_FALSE(matches.remove(bravo));
    EXPECT_TRUE(matches.remove(*relabeled));
    EXPECT_EQ(matches.size(), 2u);
}

TEST_F(MatchesTest, NamedWithPredicate) {
    auto matches = sample();
    EXPECT_EQ(matches.named(names::kTitle).size(), 2u);
    EXPECT_EQ(matches.named(names::kTitle, HasTag{names::kTitle}).size(), 2u);
    EXPECT_TRUE(matches.named(names::kTitle, HasTag{"other"}).empty());
    EXPECT_TRUE(matches.named(names::kSeason).empty());
}

TEST_F(MatchesTest, PreviousOnlyLooksAtNearestEnd) {
    auto matches = sample();
    auto bravo = matches.all()[2];

    auto any = matches.previous(bravo);
    ASSERT_EQ(any.size(), 1u);
    EXPECT_EQ(any[0].name, names::kEpisodeNumber);

    // The nearest match is the episode number, so the farther title is not returned.
    EXPECT_TRUE(matches.previous(bravo, NameIs{names::kTitle}).empty());
    EXPECT_TRUE(matches.previous(matches.all()[0]).empty());
}

TEST_F(MatchesTest, PreviousStopsAtFloor) {
    auto matches = sample();
    auto bravo = matches.all()[2];
    EXPECT_TRUE(matches.previous(bravo, AnyMatch{}, 10).empty());
    EXPECT_EQ(matches.previous(bravo, AnyMatch{}, 9).size(), 1u);
}

TEST_F(MatchesTest, NextFindsNearestStart) {
    auto matches = sample();
    auto alpha = matches.all()[0];

    auto following = matches.next(alpha);
    ASSERT_EQ(following.size(), 1u);
    EXPECT_EQ(following[0].name, names::kEpisodeNumber);
    EXPECT_TRUE(matches.next(matches.all()[2]).empty());
}

TEST_F(MatchesTest, RangeAndIndexQueries) {
    auto matches = sample();
    EXPECT_EQ(matches.range(0, 9).size(), 2u);
    EXPECT_EQ(matches.range(1, 15).size(), 2u);
    EXPECT_EQ(matches.range(0, kToEnd, NameIs{names::kTitle}).size(), 2u);
    EXPECT_EQ(matches.starting(6).size(), 1u);
    EXPECT_EQ(matches.ending(9).size(), 1u);
    EXPECT_EQ(matches.at_index(7).size(), 1u);
    EXPECT_TRUE(matches.at_index(5).empty());
}

TEST_F(MatchesTest, HolesBetweenMatches) {
    auto matches = build(input_, {{names::kEpisodeNumber, "E05"}});

    HoleOptions options;
    options.formatter = formatters::cleanup;
    auto holes = matches.holes(0, kToEnd, options);

    ASSERT_EQ(holes.size(), 2u);
    EXPECT_EQ(holes[0].start, 0u);
    EXPECT_EQ(holes[0].end, 6u);
    EXPECT_EQ(holes[0].value, "Alpha");
    EXPECT_EQ(holes[1].start, 9u);
    EXPECT_EQ(holes[1].end, 15u);
    EXPECT_EQ(holes[1].value, "Bravo");
}

TEST_F(MatchesTest, HolesIgnoreMatches) {
    auto matches = build("Show.French.S01", {{names::kLanguage, "French"}, {names::kSeason, "S01"}});

    HoleOptions options;
    options.formatter = formatters::cleanup;
    options.ignore = NameIs{names::kLanguage};
    auto holes = matches.holes(0, kToEnd, options);

    ASSERT_EQ(holes.size(), 1u);
    EXPECT_EQ(holes[0].value, "Show French");
}

TEST_F(MatchesTest, HolesCloseAtSeparators) {
    Matches matches("Show Name - Alt");

    HoleOptions options;
    options.formatter = formatters::cleanup;
    options.seps = std::string(formatters::kTitleSeps);
    auto holes = matches.holes(0, kToEnd, options);

    ASSERT_EQ(holes.size(), 2u);
    EXPECT_EQ(holes[0].end, 10u);
    EXPECT_EQ(holes[0].value, "Show Name");
    EXPECT_EQ(holes[1].start, 11u);
    EXPECT_EQ(holes[1].value, "Alt");
}

TEST_F(MatchesTest, HolesWithoutValueAreDropped) {
    auto matches = build("S01.E02", {{names::kSeason, "S01"}, {names::kEpisodeNumber, "E02"}});

    HoleOptions options;
    options.formatter = formatters::cleanup;
    EXPECT_TRUE(matches.holes(0, kToEnd, options).empty());
}

TEST_F(MatchesTest, ChainThroughSeparators) {
    auto matches = build("Show - Alt", {{names::kTitle, "Show", {names::kTitle}},
                                        {names::kAlternativeTitle, "Alt", {names::kTitle}}});

    auto before = matches.chain_before(7, formatters::kSeps, HasTag{names::kTitle});
    ASSERT_EQ(before.size(), 1u);
    EXPECT_EQ(before[0].value, "Show");

    auto after = matches.chain_after(4, formatters::kSeps, HasTag{names::kTitle});
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].value, "Alt");

    EXPECT_TRUE(matches.chain_before(7, formatters::kSeps, NameIs{names::kSeason}).empty());
}

TEST_F(MatchesTest, ChainStopsAtText) {
    auto matches = build("Show and Alt", {{names::kTitle, "Show", {names::kTitle}},
                                          {names::kAlternativeTitle, "Alt", {names::kTitle}}});

    EXPECT_TRUE(matches.chain_before(9, formatters::kSeps, HasTag{names::kTitle}).empty());
}

TEST_F(MatchesTest, SplitDropsEmptyPieces) {
    Matches matches("a--b");
    auto pieces = matches.split(make_match("a--b", 0, 4, names::kTitle), "-");

    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0].value, "a");
    EXPECT_EQ(pieces[1].value, "b");
    EXPECT_EQ(pieces[1].start, 3u);
    EXPECT_EQ(pieces[1].name, names::kTitle);
}

TEST_F(MatchesTest, CropRemovesCoveredParts) {
    Matches matches("abcdefghij");
    auto target = make_match("abcdefghij", 0, 10, names::kTitle);
    auto pieces = matches.crop(target, {make_match("abcdefghij", 3, 5, names::kGroup)});

    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0].value, "abc");
    EXPECT_EQ(pieces[1].value, "fghij");
}

TEST_F(MatchesTest, PathMarkersSkipEmptySegments) {
    Matches matches("a//b\\c");
    add_path_markers(matches);

    auto markers = matches.markers(names::kPath);
    ASSERT_EQ(markers.size(), 3u);
    EXPECT_EQ(markers[0].value, "a");
    EXPECT_EQ(markers[1].start, 3u);
    EXPECT_EQ(markers[1].value, "b");
    EXPECT_EQ(markers[2].value, "c");
}

TEST_F(MatchesTest, JsonSerialization) {
    auto matches = sample();
    nlohmann::json j = matches;

    EXPECT_EQ(j["input"], input_);
    EXPECT_EQ(j["markers"].size(), 1u);
    ASSERT_EQ(j["matches"].size(), 3u);
    EXPECT_EQ(j["matches"][1]["name"], names::kEpisodeNumber);

    auto restored = j.get<Matches>();
    EXPECT_EQ(restored.all(), matches.all());
    EXPECT_EQ(restored.markers(names::kPath).size(), 1u);
}

TEST_F(MatchesTest, JsonWithoutValueUsesRawText) {
    auto j = nlohmann::json::parse(R"({
        "input": "Alpha.E05.Bravo",
        "matches": [{"start": 6, "end": 9, "name": "episodeNumber"}]
    })");

    auto matches = j.get<Matches>();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches.all()[0].value, "E05");
    EXPECT_TRUE(matches.all()[0].tags.empty());
}
