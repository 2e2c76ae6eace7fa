// Tests for the rule registry, rule graph and pipeline
#include <gtest/gtest.h>

#include <episode_title/errors.hpp>
#include <episode_title/pipeline.hpp>
#include <episode_title/rules/registry.hpp>

#include <algorithm>

#include "testutil/fixtures.hpp"
#include "testutil/loader.hpp"

using namespace episode_title;
using namespace episode_title::testutil;

namespace {

// Rule with a fixed id and dependencies that never fires
class StubRule : public Rule {
  public:
    StubRule(std::string id, std::vector<std::string> dependencies = {})
        : id_(std::move(id)), dependencies_(std::move(dependencies)) {}

    std::string id() const override { return id_; }
    std::vector<std::string> dependencies() const override { return dependencies_; }
    Consequence when(const Matches&) const override { return {}; }

  private:
    std::string id_;
    std::vector<std::string> dependencies_;
};

std::vector<std::string> ids(const std::vector<const Rule*>& rules) {
    std::vector<std::string> result;
    for (const auto* rule : rules) {
        result.push_back(rule->id());
    }
    return result;
}

}  // namespace

class PipelineTest : public ::testing::Test {
  protected:
    void SetUp() override { loader_ = std::make_unique<Loader>(Loader::from_compile_definition()); }

    std::unique_ptr<Loader> loader_;
};

// Whole pipeline over the shared scenario data
TEST_F(PipelineTest, PipelineScenarios) {
    auto test_cases = loader_->get_test_cases("episode_title", "pipeline");
    ASSERT_FALSE(test_cases.empty()) << "No test cases loaded";

    for (const auto& tc : test_cases) {
        auto config = default_config();
        if (tc.config) {
            from_json(*tc.config, config);
        }
        auto pipeline = make_pipeline(config);

        auto matches = build(tc.input);
        pipeline.run(matches);

        EXPECT_EQ(names_and_values(matches), tc.expected_matches())
            << "Test case: " << tc.id << " - " << tc.description;
    }
}

TEST_F(PipelineTest, DefaultOrder) {
    auto pipeline = make_pipeline();
    std::vector<std::string> expected = {
        "TitleFromPosition",   "Filepart3EpisodeTitle",    "Filepart2EpisodeTitle",
        "TitleToEpisodeTitle", "EpisodeTitleFromPosition", "AlternativeTitleReplace"};
    EXPECT_EQ(pipeline.order(), expected);
}

TEST_F(PipelineTest, FilepartRulesAfterChain) {
    auto pipeline = make_pipeline(make_config({with_filepart_placement(FilepartPlacement::AfterChain)}));
    std::vector<std::string> expected = {
        "TitleFromPosition",       "TitleToEpisodeTitle",   "EpisodeTitleFromPosition",
        "AlternativeTitleReplace", "Filepart3EpisodeTitle", "Filepart2EpisodeTitle"};
    EXPECT_EQ(pipeline.order(), expected);
}

TEST_F(PipelineTest, WithoutTitleFromPosition) {
    auto pipeline = make_pipeline(make_config({without_title_from_position()}));
    ASSERT_EQ(pipeline.order().size(), 5u);
    EXPECT_EQ(pipeline.order().front(), "Filepart3EpisodeTitle");
}

TEST_F(PipelineTest, InvalidConfigIsRejected) {
    EXPECT_THROW((void)make_pipeline(make_config({with_episode_anchors({})})), ConfigError);
}

TEST_F(PipelineTest, RunReport) {
    auto pipeline = make_pipeline();
    auto matches = build("Show.S01E02.Episode.Name.mkv", {{names::kSeason, "S01"},
                                                          {names::kEpisodeNumber, "E02"},
                                                          {"container", "mkv"}});

    auto report = pipeline.run(matches);
    ASSERT_EQ(report.outcomes.size(), 6u);
    EXPECT_TRUE(report.fired("TitleFromPosition"));
    EXPECT_TRUE(report.fired("EpisodeTitleFromPosition"));
    EXPECT_FALSE(report.fired("TitleToEpisodeTitle"));
    EXPECT_FALSE(report.fired("AlternativeTitleReplace"));
    EXPECT_EQ(report.outcomes[0].appended, 1u);

    // A second run finds nothing left to do.
    auto again = pipeline.run(matches);
    for (const auto& outcome : again.outcomes) {
        EXPECT_FALSE(outcome.fired) << outcome.rule;
    }
}

TEST_F(PipelineTest, SecondRunLeavesMatchesUnchanged) {
    auto pipeline = make_pipeline();
    auto matches = build("Show - Extras/Season 1/E02.Pilot.mkv", {{names::kSeason, "Season 1"},
                                                                  {names::kEpisodeNumber, "E02"},
                                                                  {"container", "mkv"}});

    pipeline.run(matches);
    const auto once = names_and_values(matches);
    EXPECT_EQ(once, (std::vector<std::pair<std::string, std::string>>{
                        {names::kTitle, "Show"},
                        {names::kSeason, "Season 1"},
                        {names::kEpisodeNumber, "E02"},
                        {names::kEpisodeTitle, "Pilot"},
                        {"container", "mkv"}}));

    auto again = pipeline.run(matches);
    for (const auto& outcome : again.outcomes) {
        EXPECT_FALSE(outcome.fired) << outcome.rule;
    }
    EXPECT_EQ(names_and_values(matches), once);
}

TEST_F(PipelineTest, GraphOrdersByDependencies) {
    RuleGraph graph;
    graph.add_rule(std::make_unique<StubRule>("C", std::vector<std::string>{"B"}));
    graph.add_rule(std::make_unique<StubRule>("B", std::vector<std::string>{"A"}));
    graph.add_rule(std::make_unique<StubRule>("A"));
    graph.add_rule(std::make_unique<StubRule>("D"));

    EXPECT_EQ(ids(graph.resolve()), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST_F(PipelineTest, GraphIgnoresAbsentDependencies) {
    RuleGraph graph;
    graph.add_rule(std::make_unique<StubRule>("B", std::vector<std::string>{"Missing"}));
    graph.add_rule(std::make_unique<StubRule>("A"));

    EXPECT_EQ(ids(graph.resolve()), (std::vector<std::string>{"B", "A"}));
}

TEST_F(PipelineTest, GraphRejectsDuplicates) {
    RuleGraph graph;
    graph.add_rule(std::make_unique<StubRule>("A"));
    try {
        graph.add_rule(std::make_unique<StubRule>("A"));
        FAIL() << "Expected RuleGraphError";
    } catch (const RuleGraphError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DuplicateRule);
        EXPECT_EQ(e.rule(), "A");
    }
    EXPECT_EQ(graph.size(), 1u);
}

TEST_F(PipelineTest, GraphRejectsUnknownEdges) {
    RuleGraph graph;
    graph.add_rule(std::make_unique<StubRule>("A"));
    try {
        graph.add_edge("A", "Missing");
        FAIL() << "Expected RuleGraphError";
    } catch (const RuleGraphError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnknownRule);
        EXPECT_EQ(e.rule(), "Missing");
    }
}

TEST_F(PipelineTest, GraphDetectsCycles) {
    RuleGraph graph;
    graph.add_rule(std::make_unique<StubRule>("A", std::vector<std::string>{"B"}));
    graph.add_rule(std::make_unique<StubRule>("B"));
    graph.add_edge("A", "B");

    try {
        (void)graph.resolve();
        FAIL() << "Expected RuleGraphError";
    } catch (const RuleGraphError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RuleCycle);
    }
    EXPECT_THROW((void)Pipeline(std::move(graph)), RuleGraphError);
}

TEST_F(PipelineTest, RegistryBuiltins) {
    auto& registry = RuleRegistry::instance();
    for (const auto& id : {"TitleFromPosition", "TitleToEpisodeTitle", "EpisodeTitleFromPosition",
                           "AlternativeTitleReplace", "Filepart3EpisodeTitle",
                           "Filepart2EpisodeTitle"}) {
        ASSERT_TRUE(registry.has_rule(id)) << id;
        EXPECT_EQ(registry.create(id, default_config())->id(), id);
    }

    try {
        (void)registry.create("NoSuchRule", default_config());
        FAIL() << "Expected RuleGraphError";
    } catch (const RuleGraphError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnknownRule);
    }
}

TEST_F(PipelineTest, RegistryAcceptsCustomRules) {
    auto& registry = RuleRegistry::instance();
    registry.register_rule("CustomRule", [](const EngineConfig&) {
        return std::make_unique<StubRule>("CustomRule");
    });

    EXPECT_TRUE(registry.has_rule("CustomRule"));
    auto rules = registry.registered_rules();
    EXPECT_TRUE(std::is_sorted(rules.begin(), rules.end()));
    EXPECT_NE(std::find(rules.begin(), rules.end(), "CustomRule"), rules.end());
}

TEST_F(PipelineTest, ApplyConsequenceOrder) {
    const std::string input = "Alpha.E05.Bravo";
    auto matches = build(input, {{names::kTitle, "Alpha", {names::kTitle}},
                                 {names::kEpisodeNumber, "E05"}});
    auto alpha = matches.all()[0];

    Consequence consequence;
    consequence.remove.push_back(matches.all()[1]);
    consequence.relabel.push_back({alpha, names::kAlternativeTitle});
    consequence.append.push_back(make_match(input, 10, 15, names::kEpisodeTitle));
    apply_consequence(matches, consequence);

    EXPECT_EQ(names_and_values(matches),
              (std::vector<std::pair<std::string, std::string>>{
                  {names::kAlternativeTitle, "Alpha"}, {names::kEpisodeTitle, "Bravo"}}));

    // Entries that are already gone are skipped.
    consequence.append.clear();
    EXPECT_NO_THROW(apply_consequence(matches, consequence));
    EXPECT_EQ(matches.size(), 2u);
}
