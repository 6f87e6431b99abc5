#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "margin_core/retrieval/sub_query_planner.hpp"
#include "../../common/mocks_test.hpp"

namespace margin_core {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

using Queries = std::vector<std::string>;

TEST(SubQueryPlannerTest, ParsesPlainArray) {
  EXPECT_EQ(SubQueryPlanner::parse_response(R"(["a", "b"])", "q"), (Queries{"a", "b"}));
}

TEST(SubQueryPlannerTest, StripsMarkdownFence) {
  EXPECT_EQ(SubQueryPlanner::parse_response("```json\n[\"one\", \"two\"]\n```", "q"), (Queries{"one", "two"}));
}

TEST(SubQueryPlannerTest, ToleratesSurroundingProse) {
  EXPECT_EQ(SubQueryPlanner::parse_response("Sure! [\"x\"] Hope that helps.", "q"), (Queries{"x"}));
}

TEST(SubQueryPlannerTest, KeepsAtMostThree) {
  EXPECT_EQ(SubQueryPlanner::parse_response(R"(["1", "2", "3", "4", "5"])", "q"), (Queries{"1", "2", "3"}));
}

TEST(SubQueryPlannerTest, DropsBlankEntries) {
  EXPECT_EQ(SubQueryPlanner::parse_response(R"(["  ", "real  "])", "q"), (Queries{"real"}));
}

TEST(SubQueryPlannerTest, FallsBackToQuestion) {
  EXPECT_EQ(SubQueryPlanner::parse_response("no array here", "q"), (Queries{"q"}));
  EXPECT_EQ(SubQueryPlanner::parse_response("[not json", "q"), (Queries{"q"}));
  EXPECT_EQ(SubQueryPlanner::parse_response("[]", "q"), (Queries{"q"}));
  EXPECT_EQ(SubQueryPlanner::parse_response(R"({"queries": 1})", "q"), (Queries{"q"}));
}

TEST(SubQueryPlannerTest, PlanWithoutGeneratorUsesQuestion) {
  EXPECT_EQ(SubQueryPlanner::plan(nullptr, "why?"), (Queries{"why?"}));
}

TEST(SubQueryPlannerTest, PlanAsksGeneratorWithQuestion) {
  margin_tests::MockTextGenerator generator;
  EXPECT_CALL(generator, generate_text(HasSubstr("User question: \"why?\""))).WillOnce(Return(R"(["because"])"));

  EXPECT_EQ(SubQueryPlanner::plan(&generator, "why?"), (Queries{"because"}));
}

TEST(SubQueryPlannerTest, PlanSurvivesGeneratorError) {
  margin_tests::MockTextGenerator generator;
  EXPECT_CALL(generator, generate_text(_)).WillOnce(Throw(TextGenerationError("down")));

  EXPECT_EQ(SubQueryPlanner::plan(&generator, "why?"), (Queries{"why?"}));
}

}  // namespace margin_core
