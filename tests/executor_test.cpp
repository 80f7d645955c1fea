#include "flowcore/executor/executor.hpp"
#include "flowcore/executor/local_executor.hpp"
#include "flowcore/executor/target_registry.hpp"
#include "flowcore/store/object_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace flowcore;
using namespace std::chrono_literals;

namespace {

auto int_value(std::int64_t v) -> JsonValue { return JsonValue{v}; }

auto json_of(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return parsed.value_or(JsonValue{nullptr});
}

} // namespace

class ExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ExecutorConfig cfg;
    cfg.threads = 4;
    executor_ = std::make_unique<LocalExecutor>(cfg);
    ASSERT_TRUE(executor_->connect());
  }

  auto request(StageFunction fn, StageArgs args = {}) -> StageRequest {
    return StageRequest{.fn = std::move(fn),
                        .context = StageContext{.stage = "s"},
                        .args = std::move(args),
                        .resources = {}};
  }

  std::unique_ptr<LocalExecutor> executor_;
};

TEST_F(ExecutorTest, InvokeReturnsOutput) {
  auto result = test::run_coro(invoke(
      *executor_,
      request([](const StageContext &, const StageArgs &args) {
        return ok(int_value(*json::as_int(args.at(0)) * 2));
      },
              {int_value(21)})));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(json::as_int(result.output), 42);
}

TEST_F(ExecutorTest, StageErrorIsReported) {
  auto result = test::run_coro(
      invoke(*executor_, request([](const StageContext &, const StageArgs &)
                                     -> Result<JsonValue> {
               return fail(Error::InvalidArgument);
             })));
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, make_error_code(Error::InvalidArgument));
}

TEST_F(ExecutorTest, ExceptionBecomesExecutionFailed) {
  auto result = test::run_coro(
      invoke(*executor_, request([](const StageContext &, const StageArgs &)
                                     -> Result<JsonValue> {
               throw std::runtime_error("division by zero");
             })));
  EXPECT_EQ(result.error, make_error_code(Error::ExecutionFailed));
  EXPECT_EQ(result.message, "division by zero");
}

TEST_F(ExecutorTest, MissingFunctionIsResolutionFailure) {
  auto result = test::run_coro(invoke(*executor_, request(StageFunction{})));
  EXPECT_EQ(result.error, make_error_code(Error::ResolutionFailed));
}

TEST_F(ExecutorTest, DisconnectedExecutorRefusesWork) {
  executor_->disconnect();
  EXPECT_FALSE(executor_->connected());
  auto result = test::run_coro(invoke(
      *executor_, request([](const StageContext &, const StageArgs &) {
        return ok(JsonValue{nullptr});
      })));
  EXPECT_EQ(result.error, make_error_code(Error::ExecutorUnavailable));
}

TEST_F(ExecutorTest, InvokeManyKeepsInputOrder) {
  // Later elements finish first.
  auto fn = [](const StageContext &ctx, const StageArgs &args) {
    auto v = *json::as_int(args.at(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(5 * (5 - v)));
    EXPECT_EQ(ctx.element_count, 5u);
    EXPECT_EQ(ctx.element_index, static_cast<std::size_t>(v));
    return ok(int_value(v * 10));
  };
  std::vector<StageArgs> lists;
  for (std::int64_t i = 0; i < 5; ++i) {
    lists.push_back({int_value(i)});
  }

  auto results = test::run_coro(invoke_many(*executor_, fn,
                                            StageContext{.stage = "map"},
                                            std::move(lists), {}));
  ASSERT_EQ(results.size(), 5);
  for (std::size_t i = 0; i < results.size(); ++i) {
    ASSERT_TRUE(results[i].ok());
    EXPECT_EQ(json::as_int(results[i].output),
              static_cast<std::int64_t>(i * 10));
  }
}

TEST_F(ExecutorTest, InvokeManyEmpty) {
  auto results = test::run_coro(invoke_many(
      *executor_,
      [](const StageContext &, const StageArgs &) { return ok(JsonValue{}); },
      StageContext{}, {}, {}));
  EXPECT_TRUE(results.empty());
}

TEST_F(ExecutorTest, InvokeManyRunsInParallel) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  auto fn = [&](const StageContext &, const StageArgs &) {
    auto now = running.fetch_add(1) + 1;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(30ms);
    running.fetch_sub(1);
    return ok(JsonValue{nullptr});
  };
  auto results = test::run_coro(invoke_many(
      *executor_, fn, StageContext{}, std::vector<StageArgs>(4), {}));
  EXPECT_EQ(results.size(), 4);
  EXPECT_GT(peak.load(), 1);
}

TEST(LocalExecutorTest, SessionOwnsClusterMemory) {
  LocalExecutor executor(ExecutorConfig{.threads = 1}, 16);
  EXPECT_EQ(executor.shared_memory(), nullptr);
  ASSERT_TRUE(executor.connect());
  auto memory = executor.shared_memory();
  ASSERT_NE(memory, nullptr);
  ASSERT_TRUE(memory->put("ns", "k", SerializedValue{"json", "1"}));

  // Entry limit is applied to the session's memory.
  EXPECT_FALSE(memory->put("ns", "big", SerializedValue{"json",
                                                        std::string(64, 'x')}));

  executor.disconnect();
  EXPECT_EQ(executor.shared_memory(), nullptr);
  ASSERT_TRUE(executor.connect());
  EXPECT_FALSE(executor.shared_memory()->contains("ns", "k"));
}

TEST(LocalExecutorTest, UnavailableBackend) {
  LocalExecutor executor(ExecutorConfig{.threads = 1});
  executor.set_available(false);
  EXPECT_EQ(executor.connect().error(),
            make_error_code(Error::ExecutorUnavailable));
  EXPECT_EQ(executor.shared_memory(), nullptr);
  executor.set_available(true);
  EXPECT_TRUE(executor.connect());
  EXPECT_TRUE(executor.connected());
}

TEST(LocalExecutorTest, ShutdownDrainsThePoolAndRefusesWork) {
  LocalExecutor executor(ExecutorConfig{.threads = 1});
  ASSERT_TRUE(executor.connect());
  auto memory = executor.shared_memory();
  ASSERT_NE(memory, nullptr);

  std::atomic<bool> finished{false};
  StageRequest request;
  request.fn = [&](const StageContext &, const StageArgs &) -> Result<JsonValue> {
    std::this_thread::sleep_for(100ms);
    finished.store(true);
    return ok(JsonValue{nullptr});
  };
  ASSERT_TRUE(executor.start(std::move(request), [](StageResult) {}));

  executor.shutdown();
  EXPECT_TRUE(finished.load());
  EXPECT_FALSE(executor.connected());
  EXPECT_EQ(executor.connect().error(), make_error_code(Error::InvalidState));

  // A holder keeps the session memory alive past disconnect().
  executor.disconnect();
  EXPECT_EQ(executor.shared_memory(), nullptr);
  EXPECT_TRUE(memory->put("ns", "k", SerializedValue{"json", "1"}));
}

TEST(TargetRegistryTest, ResolveRegisteredTargets) {
  TargetRegistry registry;
  register_builtin_targets(registry);
  EXPECT_TRUE(registry.contains("flowcore.builtins.identity"));
  EXPECT_TRUE(registry.resolve("flowcore.builtins.sum").has_value());
  EXPECT_EQ(registry.resolve("pkg.missing").error(),
            make_error_code(Error::ResolutionFailed));
  EXPECT_EQ(registry.targets().size(), 6);

  registry.register_target("pkg.double", [](const StageContext &,
                                            const StageArgs &args) {
    return ok(int_value(*json::as_int(args.at(0)) * 2));
  });
  auto fn = registry.resolve("pkg.double");
  ASSERT_TRUE(fn.has_value());
  EXPECT_EQ(json::as_int(*(*fn)(StageContext{}, {int_value(4)})), 8);
}

class BuiltinTargetsTest : public ::testing::Test {
protected:
  void SetUp() override { register_builtin_targets(registry_); }

  auto call(std::string_view target, StageArgs args,
            StageContext ctx = StageContext{}) -> Result<JsonValue> {
    auto fn = registry_.resolve(std::string("flowcore.builtins.") +
                                std::string(target));
    if (!fn) {
      return fail(fn.error());
    }
    return (*fn)(ctx, args);
  }

  TargetRegistry registry_;
};

TEST_F(BuiltinTargetsTest, Identity) {
  EXPECT_EQ(dump_json(*call("identity", {json_of(R"({"a":1})")})),
            R"({"a":1})");
  EXPECT_EQ(dump_json(*call("identity", {int_value(1), int_value(2)})),
            "[1,2]");
}

TEST_F(BuiltinTargetsTest, Range) {
  EXPECT_EQ(dump_json(*call("range", {int_value(3)})), "[0,1,2]");
  EXPECT_EQ(dump_json(*call("range", {json_of(
                                         R"({"start":2,"stop":9,"step":3})")})),
            "[2,5,8]");
  EXPECT_EQ(dump_json(*call("range", {json_of(R"({"n":2})")})), "[0,1]");
  EXPECT_FALSE(call("range", {json_of(R"("three")")}).has_value());
  EXPECT_FALSE(call("range", {json_of(R"({"stop":3,"step":0})")}).has_value());
}

TEST_F(BuiltinTargetsTest, Sum) {
  EXPECT_EQ(dump_json(*call("sum", {json_of("[10,20,30]")})), "60");
  EXPECT_EQ(json::as_double(*call("sum", {json_of("[1,2.5]"), int_value(1)})),
            4.5);
  EXPECT_EQ(call("sum", {json_of(R"(["x"])")}).error(),
            make_error_code(Error::InvalidArgument));
}

TEST_F(BuiltinTargetsTest, ScaleFactorSources) {
  EXPECT_EQ(json::as_int(*call("scale", {int_value(3), int_value(10)})), 30);
  EXPECT_EQ(json::as_int(*call("scale", {int_value(3)})), 3);

  auto run = std::make_shared<RunContext>();
  run->config = json_of(R"({"factor": 4})");
  run->input = json_of(R"({"factor": 100})");
  EXPECT_EQ(json::as_int(*call("scale", {int_value(3)},
                               StageContext{.run = run})),
            12);

  auto input_only = std::make_shared<RunContext>();
  input_only->config = make_object();
  input_only->input = json_of(R"({"factor": 0.5})");
  EXPECT_EQ(json::as_double(*call("scale", {int_value(3)},
                                  StageContext{.run = input_only})),
            1.5);
}

TEST_F(BuiltinTargetsTest, ObjectsNeedAStore) {
  EXPECT_EQ(call("put_object", {json_of(R"({"key":"k","value":1})")}).error(),
            make_error_code(Error::StorageUnavailable));
}

TEST_F(BuiltinTargetsTest, PutAndGetObject) {
  test::TempDir dir;
  ComputeConfig compute;
  StorageConfig storage{.artifact_dir = dir.str()};
  ObjectStore store(compute, storage, [] { return nullptr; });

  auto run = std::make_shared<RunContext>();
  run->ns = "default";
  run->store = &store;
  StageContext ctx{.run = run};

  auto key = call("put_object",
                  {json_of(R"({"key":"result","value":[1,2]})")}, ctx);
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(json::as_string(*key), "result");

  // No cluster memory here, so fallback lands on the artifact tier.
  EXPECT_TRUE(store.artifacts().get("result", "default").has_value());
  EXPECT_EQ(dump_json(*call("get_object", {json_of(R"("result")")}, ctx)),
            "[1,2]");
  EXPECT_EQ(call("get_object",
                 {json_of(R"({"key":"result","strategy":"bogus"})")}, ctx)
                .error(),
            make_error_code(Error::InvalidArgument));
}
