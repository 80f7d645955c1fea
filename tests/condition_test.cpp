#include "flowcore/trigger/condition.hpp"

#include "gtest/gtest.h"

#include <string>
#include <string_view>

using namespace flowcore;

namespace {

auto json_of(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return parsed.value_or(JsonValue{nullptr});
}

} // namespace

class ConditionTest : public ::testing::Test {
protected:
  void SetUp() override {
    event_ = json_of(R"({
      "type": "workflow_finished",
      "source": "coordinator",
      "data": {"state": "failed", "attempt": 3, "ratio": 0.5,
               "tags": ["nightly", "etl"], "empty": ""}
    })");
  }

  auto check(std::string_view rule, const EvalOptions &options = {})
      -> Result<bool> {
    auto expr = parse_condition(json_of(rule));
    if (!expr) {
      return fail(expr.error());
    }
    return matches(**expr, event_, options);
  }

  JsonValue event_;
};

TEST_F(ConditionTest, EqualityOnVar) {
  EXPECT_EQ(check(R"({"eq": [{"var": "type"}, "workflow_finished"]})"), true);
  EXPECT_EQ(check(R"({"eq": [{"var": "type"}, "workflow_started"]})"), false);
  EXPECT_EQ(check(R"({"ne": [{"var": "data.state"}, "completed"]})"), true);
}

TEST_F(ConditionTest, NumericComparisonsMixIntAndDouble) {
  EXPECT_EQ(check(R"({"gt": [{"var": "data.attempt"}, 2]})"), true);
  EXPECT_EQ(check(R"({"ge": [{"var": "data.attempt"}, 3.0]})"), true);
  EXPECT_EQ(check(R"({"lt": [{"var": "data.ratio"}, 1]})"), true);
  EXPECT_EQ(check(R"({"le": [{"var": "data.ratio"}, 0.25]})"), false);
  EXPECT_EQ(check(R"({"eq": [{"var": "data.attempt"}, 3.0]})"), true);
}

TEST_F(ConditionTest, LargeIntegersCompareExactly) {
  EXPECT_EQ(check(R"({"eq": [9007199254740993, 9007199254740992]})"), false);
  EXPECT_EQ(check(R"({"gt": [9007199254740993, 9007199254740992]})"), true);
  EXPECT_EQ(check(R"({"eq": [9007199254740993, 9007199254740993]})"), true);
}

TEST_F(ConditionTest, StringOrdering) {
  EXPECT_EQ(check(R"({"lt": ["apple", "banana"]})"), true);
  EXPECT_EQ(check(R"({"gt": ["apple", "banana"]})"), false);
}

TEST_F(ConditionTest, ArrayIndexPath) {
  EXPECT_EQ(check(R"({"eq": [{"var": "data.tags.1"}, "etl"]})"), true);
  EXPECT_EQ(check(R"({"bool": {"var": "data.tags.5"}})"), false);
}

TEST_F(ConditionTest, LogicalOperatorsShortCircuit) {
  EXPECT_EQ(check(R"({"and": [
                {"eq": [{"var": "type"}, "workflow_finished"]},
                {"eq": [{"var": "data.state"}, "failed"]}]})"),
            true);
  EXPECT_EQ(check(R"({"or": [
                {"eq": [{"var": "type"}, "nope"]},
                {"gt": [{"var": "data.attempt"}, 1]}]})"),
            true);
  // The mixed-type comparison after a false operand is never evaluated.
  EXPECT_EQ(check(R"({"and": [false, {"gt": ["a", 1]}]})"), false);
  EXPECT_EQ(check(R"({"or": [true, {"gt": ["a", 1]}]})"), true);
}

TEST_F(ConditionTest, NotAndBool) {
  EXPECT_EQ(check(R"({"not": {"var": "data.empty"}})"), true);
  EXPECT_EQ(check(R"({"not": [{"var": "data.state"}]})"), false);
  EXPECT_EQ(check(R"({"bool": {"var": "data.tags"}})"), true);
}

TEST_F(ConditionTest, MissingVarIsFalsyByDefault) {
  EXPECT_EQ(check(R"({"bool": {"var": "data.missing"}})"), false);
  EXPECT_EQ(check(R"({"eq": [{"var": "data.missing"}, null]})"), true);
  // Ordering against a missing value never matches.
  EXPECT_EQ(check(R"({"gt": [{"var": "data.missing"}, 0]})"), false);
  EXPECT_EQ(check(R"({"lt": [{"var": "data.missing"}, 0]})"), false);
}

TEST_F(ConditionTest, MissingVarDefault) {
  EXPECT_EQ(check(R"({"eq": [{"var": ["data.missing", 7]}, 7]})"), true);
  EXPECT_EQ(check(R"({"eq": [{"var": ["data.attempt", 7]}, 3]})"), true);
}

TEST_F(ConditionTest, MissingVarErrorPolicy) {
  EvalOptions strict{.missing_var = MissingVarPolicy::Error};
  auto r = check(R"({"bool": {"var": "data.missing"}})", strict);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RuleEvaluationFailed));
  EXPECT_EQ(check(R"({"bool": {"var": ["data.missing", true]}})", strict),
            true);
}

TEST_F(ConditionTest, MixedTypeOrderingFails) {
  auto r = check(R"({"gt": [{"var": "data.state"}, 1]})");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::RuleEvaluationFailed));
}

TEST_F(ConditionTest, EvaluateReturnsValues) {
  auto expr = parse_condition(json_of(R"({"var": "data.attempt"})"));
  ASSERT_TRUE(expr.has_value());
  auto v = evaluate(**expr, event_);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(json::as_int(*v), 3);
}

TEST(ConditionParseTest, RejectsMalformedRules) {
  for (std::string_view bad : {
           R"("just a string")",
           R"([{"eq": [1, 1]}])",
           R"({"eq": [1, 1], "ne": [1, 2]})",
           R"({"eq": [1]})",
           R"({"not": [true, false]})",
           R"({"equals": [1, 1]})",
           R"({"var": ""})",
           R"({"var": []})",
           R"({"var": 12})",
           R"({"and": [{"bogus": 1}]})",
       }) {
    auto rule = parse_json(bad);
    ASSERT_TRUE(rule.has_value()) << bad;
    std::string why;
    auto expr = parse_condition(*rule, &why);
    ASSERT_FALSE(expr.has_value()) << "accepted: " << bad;
    EXPECT_EQ(expr.error(), make_error_code(Error::RuleEvaluationFailed));
    EXPECT_FALSE(why.empty()) << bad;
  }
}

TEST(ConditionParseTest, SingleOperandShorthand) {
  auto rule = parse_json(R"({"not": false})");
  ASSERT_TRUE(rule.has_value());
  auto expr = parse_condition(*rule);
  ASSERT_TRUE(expr.has_value());
  EXPECT_EQ(matches(**expr, make_object()), true);
}
