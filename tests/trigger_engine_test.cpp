#include "flowcore/events/event_bus.hpp"
#include "flowcore/trigger/trigger_engine.hpp"

#include "gtest/gtest.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace flowcore;
using namespace std::chrono;

namespace {

auto json_of(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return parsed.value_or(JsonValue{nullptr});
}

auto at(int hh, int mm) -> util::TimePoint {
  return sys_days{year{2024} / 1 / 15} + hours{hh} + minutes{mm};
}

auto schedule(std::string name, std::string_view crons,
              std::string workflow = "report") -> TriggerRuleDefinition {
  return TriggerRuleDefinition{
      .name = std::move(name),
      .type = RuleType::Schedule,
      .rule = json_of(crons),
      .action = RuleAction{.parameters = JsonValue{{"workflow", workflow}}}};
}

auto condition(std::string name, std::string_view rule,
               std::string workflow = "cleanup") -> TriggerRuleDefinition {
  return TriggerRuleDefinition{
      .name = std::move(name),
      .type = RuleType::Condition,
      .rule = json_of(rule),
      .action = RuleAction{.parameters = JsonValue{
                               {"workflow", workflow},
                               {"input", JsonValue{{"origin", "rule"}}}}}};
}

auto finished_event(std::string_view state) -> Event {
  return make_event(kWorkflowChannel, "coordinator", kWorkflowFinishedEvent,
                    JsonValue{{"workflow", "etl"}, {"state", std::string(state)}});
}

} // namespace

class TriggerEngineTest : public ::testing::Test {
protected:
  auto make_engine(TriggerConfig config = {},
                   std::shared_ptr<EventBus> bus = nullptr) -> TriggerEngine {
    return TriggerEngine(config,
                         [this](RunRequest request) {
                           std::lock_guard lock(mu_);
                           requests_.push_back(std::move(request));
                         },
                         std::move(bus));
  }

  auto requests() -> std::vector<RunRequest> {
    std::lock_guard lock(mu_);
    return requests_;
  }

  std::mutex mu_;
  std::vector<RunRequest> requests_;
};

TEST_F(TriggerEngineTest, EveryFiveMinutesOverTwentyMinutes) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("five", R"(["*/5 * * * *"])")));

  std::size_t fired = 0;
  for (int m = 0; m < 20; ++m) {
    fired += engine.on_tick(at(10, m));
  }
  EXPECT_EQ(fired, 4u);

  auto got = requests();
  ASSERT_EQ(got.size(), 4);
  EXPECT_EQ(got[0].correlation_id, "2024-01-15T10:00:00Z");
  EXPECT_EQ(got[3].correlation_id, "2024-01-15T10:15:00Z");
  for (const auto &r : got) {
    EXPECT_EQ(r.workflow, "report");
    EXPECT_EQ(r.source, RunSource::Schedule);
    EXPECT_EQ(r.rule, "five");
  }

  auto rule = engine.get_rule("five");
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->fire_count, 4);
  EXPECT_EQ(rule->last_run, at(10, 15));
}

TEST_F(TriggerEngineTest, SameMinuteFiresOnce) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("every", R"(["* * * * *"])")));
  EXPECT_EQ(engine.on_tick(at(9, 0)), 1);
  EXPECT_EQ(engine.on_tick(at(9, 0) + seconds{30}), 0);
  EXPECT_EQ(engine.on_tick(at(9, 1)), 1);
}

TEST_F(TriggerEngineTest, MultipleCronsOnOneRule) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(
      schedule("two", R"(["0 * * * *", "30 * * * *"])")));
  std::size_t fired = 0;
  for (int m = 0; m < 120; ++m) {
    fired += engine.on_tick(at(8 + m / 60, m % 60));
  }
  EXPECT_EQ(fired, 4u);
}

class MissedTickTest
    : public TriggerEngineTest,
      public ::testing::WithParamInterface<
          std::tuple<MissedTickPolicy, int, std::size_t>> {};

TEST_P(MissedTickTest, CatchUpAfterGap) {
  auto [policy, max_catchup, expected] = GetParam();
  auto engine = make_engine(
      TriggerConfig{.missed_ticks = policy, .max_catchup_ticks = max_catchup});
  ASSERT_TRUE(engine.register_rule(schedule("five", R"(["*/5 * * * *"])")));

  // Clock was down from 10:01 through 10:19.
  TickWindow window{.current = at(10, 20), .previous = at(10, 0)};
  EXPECT_EQ(window.missed_count(), 19);
  EXPECT_EQ(engine.on_tick(window), expected);
  EXPECT_EQ(requests().size(), expected);
  EXPECT_EQ(requests().back().correlation_id, "2024-01-15T10:20:00Z");
}

INSTANTIATE_TEST_SUITE_P(
    Policies, MissedTickTest,
    ::testing::Values(
        // Only the current minute.
        std::make_tuple(MissedTickPolicy::Skip, 60, std::size_t{1}),
        // 10:15 plus 10:20.
        std::make_tuple(MissedTickPolicy::FireOnce, 60, std::size_t{2}),
        // 10:05, 10:10, 10:15 plus 10:20.
        std::make_tuple(MissedTickPolicy::FireAll, 60, std::size_t{4}),
        // Catch-up window starts at 10:13.
        std::make_tuple(MissedTickPolicy::FireAll, 7, std::size_t{2}),
        std::make_tuple(MissedTickPolicy::FireAll, 0, std::size_t{1})));

TEST_F(TriggerEngineTest, CatchUpDoesNotRepeatEarlierFirings) {
  auto engine =
      make_engine(TriggerConfig{.missed_ticks = MissedTickPolicy::FireAll});
  ASSERT_TRUE(engine.register_rule(schedule("five", R"(["*/5 * * * *"])")));
  EXPECT_EQ(engine.on_tick(at(10, 10)), 1);

  // A window whose start predates the rule's last firing.
  TickWindow window{.current = at(10, 20), .previous = at(10, 0)};
  EXPECT_EQ(engine.on_tick(window), 2);
  auto got = requests();
  ASSERT_EQ(got.size(), 3);
  EXPECT_EQ(got[1].correlation_id, "2024-01-15T10:15:00Z");
}

TEST_F(TriggerEngineTest, OverlappingSchedulesCatchUpEachMinuteOnce) {
  auto engine =
      make_engine(TriggerConfig{.missed_ticks = MissedTickPolicy::FireAll});
  ASSERT_TRUE(engine.register_rule(
      schedule("both", R"(["*/5 * * * *", "*/10 * * * *"])")));

  TickWindow window{.current = at(10, 20), .previous = at(10, 0)};
  EXPECT_EQ(engine.on_tick(window), 4);
  auto got = requests();
  ASSERT_EQ(got.size(), 4);
  EXPECT_EQ(got[0].correlation_id, "2024-01-15T10:05:00Z");
  EXPECT_EQ(got[1].correlation_id, "2024-01-15T10:10:00Z");
  EXPECT_EQ(got[2].correlation_id, "2024-01-15T10:15:00Z");
}

TEST_F(TriggerEngineTest, ConditionRuleFiresOnMatchingEvent) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(
      condition("on_fail", R"({"and": [
          {"eq": [{"var": "type"}, "workflow_finished"]},
          {"eq": [{"var": "data.state"}, "failed"]}]})")));

  EXPECT_EQ(engine.on_event(finished_event("completed")), 0);
  auto event = finished_event("failed");
  EXPECT_EQ(engine.on_event(event), 1);

  auto got = requests();
  ASSERT_EQ(got.size(), 1);
  EXPECT_EQ(got[0].workflow, "cleanup");
  EXPECT_EQ(got[0].source, RunSource::Trigger);
  EXPECT_EQ(got[0].correlation_id, event.id.str());
  EXPECT_EQ(dump_json(got[0].input), R"({"origin":"rule"})");
}

TEST_F(TriggerEngineTest, ScheduleRulesIgnoreEventsAndViceVersa) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("tick", R"(["* * * * *"])")));
  ASSERT_TRUE(engine.register_rule(condition("always", R"({"bool": true})")));
  EXPECT_EQ(engine.on_event(finished_event("completed")), 1);
  EXPECT_EQ(engine.on_tick(at(0, 0)), 1);
  auto got = requests();
  ASSERT_EQ(got.size(), 2);
  EXPECT_EQ(got[0].rule, "always");
  EXPECT_EQ(got[1].rule, "tick");
}

TEST_F(TriggerEngineTest, UncomparableEventDataDoesNotDisableRule) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(
      condition("high_count", R"({"gt": [{"var": "data.state"}, 3]})")));
  EXPECT_EQ(engine.on_event(finished_event("failed")), 0);

  auto rule = engine.get_rule("high_count");
  ASSERT_TRUE(rule.has_value());
  EXPECT_TRUE(rule->enabled);
  EXPECT_FALSE(rule->last_error.empty());

  auto numeric = make_event(kWorkflowChannel, "coordinator",
                            kWorkflowFinishedEvent,
                            JsonValue{{"workflow", "etl"},
                                      {"state", std::int64_t{5}}});
  EXPECT_EQ(engine.on_event(numeric), 1);
  ASSERT_EQ(requests().size(), 1u);
  EXPECT_EQ(engine.get_rule("high_count")->fire_count, 1u);
}

TEST_F(TriggerEngineTest, MissingVarErrorPolicySkipsEventsWithoutThePath) {
  auto engine =
      make_engine(TriggerConfig{.missing_var = MissingVarPolicy::Error});
  ASSERT_TRUE(engine.register_rule(
      condition("on_failure", R"({"eq": [{"var": "data.state"}, "failed"]})")));

  // A run_workflow event carries no state.
  auto fired = make_event(kWorkflowChannel, kTriggerSource, kRunWorkflowEvent,
                          JsonValue{{"identifier", "etl"}});
  EXPECT_EQ(engine.on_event(fired), 0);
  EXPECT_TRUE(engine.get_rule("on_failure")->enabled);

  EXPECT_EQ(engine.on_event(finished_event("failed")), 1);
  EXPECT_EQ(requests().size(), 1u);
}

TEST_F(TriggerEngineTest, InvalidRuleIsRecordedDisabled) {
  auto engine = make_engine();
  auto r = engine.register_rule(schedule("broken", R"(["not cron"])"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(engine.size(), 1);

  auto rule = engine.get_rule("broken");
  ASSERT_TRUE(rule.has_value());
  EXPECT_FALSE(rule->enabled);
  EXPECT_FALSE(rule->last_error.empty());
  EXPECT_EQ(engine.on_tick(at(0, 0)), 0);

  EXPECT_FALSE(engine.set_enabled("broken", true).has_value());
}

TEST_F(TriggerEngineTest, EnableDisableAndUnregister) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("tick", R"(["* * * * *"])")));

  ASSERT_TRUE(engine.set_enabled("tick", false));
  EXPECT_EQ(engine.on_tick(at(1, 0)), 0);
  ASSERT_TRUE(engine.set_enabled("tick", true));
  EXPECT_EQ(engine.on_tick(at(1, 1)), 1);

  ASSERT_TRUE(engine.unregister_rule("tick"));
  EXPECT_EQ(engine.size(), 0);
  EXPECT_EQ(engine.unregister_rule("tick").error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(engine.set_enabled("tick", true).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(engine.get_rule("tick").error(), make_error_code(Error::NotFound));
}

TEST_F(TriggerEngineTest, RegisterReplacesRuleOfSameName) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("r", R"(["* * * * *"])", "a")));
  ASSERT_TRUE(engine.register_rule(schedule("r", R"(["* * * * *"])", "b")));
  EXPECT_EQ(engine.size(), 1);
  EXPECT_EQ(engine.on_tick(at(3, 0)), 1);
  EXPECT_EQ(requests().at(0).workflow, "b");
}

TEST_F(TriggerEngineTest, ListRulesIsSortedByName) {
  auto engine = make_engine();
  ASSERT_TRUE(engine.register_rule(schedule("zeta", R"(["@daily"])")));
  ASSERT_TRUE(engine.register_rule(schedule("alpha", R"(["@daily"])")));
  auto rules = engine.list_rules();
  ASSERT_EQ(rules.size(), 2);
  EXPECT_EQ(rules[0].name(), "alpha");
  EXPECT_EQ(rules[1].name(), "zeta");
}

TEST_F(TriggerEngineTest, FiringIsAnnouncedOnTheBus) {
  boost::asio::io_context io;
  auto bus = EventBus::create();
  auto stream = bus->subscribe(io.get_executor(), [](const Event &e) {
    return e.type == kRunWorkflowEvent;
  });

  auto engine = make_engine({}, bus);
  ASSERT_TRUE(engine.register_rule(schedule("tick", R"(["* * * * *"])")));
  EXPECT_EQ(engine.on_tick(at(6, 30)), 1);

  auto event = stream.try_next();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->source, kTriggerSource);
  EXPECT_EQ(event->correlation_id, "2024-01-15T06:30:00Z");
  EXPECT_EQ(json::as_string(*json::find_path(event->data, "identifier")),
            "report");
  EXPECT_EQ(json::as_string(*json::find_path(event->data, "rule")), "tick");
}

TEST_F(TriggerEngineTest, NoSubmitterStillCountsFiring) {
  TriggerEngine engine(TriggerConfig{}, SubmitCallback{});
  ASSERT_TRUE(engine.register_rule(schedule("tick", R"(["* * * * *"])")));
  EXPECT_EQ(engine.on_tick(at(2, 0)), 1);

  engine.set_submit([this](RunRequest request) {
    std::lock_guard lock(mu_);
    requests_.push_back(std::move(request));
  });
  EXPECT_EQ(engine.on_tick(at(2, 1)), 1);
  EXPECT_EQ(requests().size(), 1);
}
