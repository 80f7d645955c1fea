#include "flowcore/executor/executor_session.hpp"
#include "flowcore/executor/local_executor.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <vector>

using namespace flowcore;

namespace {

// Refuses the first `failures` connects with `error`.
class FlakyExecutor final : public IExecutor {
public:
  FlakyExecutor(int failures, Error error) : failures_(failures), error_(error) {}

  auto start(StageRequest, StageCompletion) -> Result<void> override {
    return fail(Error::ExecutorUnavailable);
  }
  auto connect() -> Result<void> override {
    attempts_.fetch_add(1);
    if (failures_ > 0) {
      --failures_;
      return fail(error_);
    }
    connected_ = true;
    return ok();
  }
  auto disconnect() -> void override { connected_ = false; }
  auto connected() const noexcept -> bool override { return connected_; }
  auto shared_memory() -> std::shared_ptr<ClusterMemory> override {
    return nullptr;
  }

  [[nodiscard]] auto attempts() const -> int { return attempts_.load(); }

private:
  int failures_;
  Error error_;
  bool connected_{false};
  std::atomic<int> attempts_{0};
};

auto session_config(int attempts, int timeout_ms = 2000) -> ExecutorConfig {
  ExecutorConfig cfg;
  cfg.reconnect_timeout_ms = timeout_ms;
  cfg.max_reconnect_attempts = attempts;
  cfg.reconnect_initial_backoff_ms = 1;
  cfg.reconnect_max_backoff_ms = 4;
  return cfg;
}

} // namespace

TEST(ExecutorSessionTest, AlreadyConnectedIsImmediate) {
  FlakyExecutor executor(0, Error::ExecutorUnavailable);
  ASSERT_TRUE(executor.connect());
  ExecutorSession session(executor, session_config(3));
  EXPECT_TRUE(test::run_coro(session.ensure_connected()));
  EXPECT_EQ(executor.attempts(), 1);
  EXPECT_EQ(session.health(), ExecutorHealth::Healthy);
}

TEST(ExecutorSessionTest, TransientLossIsRetried) {
  FlakyExecutor executor(2, Error::ExecutorUnavailable);
  ExecutorSession session(executor, session_config(5));
  std::vector<ExecutorHealth> transitions;
  session.on_health_change(
      [&](ExecutorHealth h) { transitions.push_back(h); });

  EXPECT_TRUE(test::run_coro(session.ensure_connected()));
  EXPECT_EQ(executor.attempts(), 3);
  EXPECT_EQ(session.health(), ExecutorHealth::Healthy);
  EXPECT_EQ(transitions, (std::vector<ExecutorHealth>{
                             ExecutorHealth::Degraded,
                             ExecutorHealth::Healthy}));
}

TEST(ExecutorSessionTest, ExhaustedBudgetIsUnhealthy) {
  FlakyExecutor executor(100, Error::ExecutorUnavailable);
  ExecutorSession session(executor, session_config(3));

  auto r = test::run_coro(session.ensure_connected());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ExecutorUnavailable));
  // One initial attempt plus three retries.
  EXPECT_EQ(executor.attempts(), 4);
  EXPECT_EQ(session.health(), ExecutorHealth::Unhealthy);
}

TEST(ExecutorSessionTest, ReconnectTimeoutBoundsRetries) {
  FlakyExecutor executor(1000, Error::ExecutorUnavailable);
  ExecutorConfig cfg = session_config(1000, 50);
  cfg.reconnect_initial_backoff_ms = 10;
  cfg.reconnect_max_backoff_ms = 10;
  ExecutorSession session(executor, cfg);

  auto started = std::chrono::steady_clock::now();
  auto r = test::run_coro(session.ensure_connected());
  auto elapsed = std::chrono::steady_clock::now() - started;
  ASSERT_FALSE(r.has_value());
  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_LT(executor.attempts(), 20);
  EXPECT_EQ(session.health(), ExecutorHealth::Unhealthy);
}

TEST(ExecutorSessionTest, PermanentErrorIsNotRetried) {
  FlakyExecutor executor(5, Error::InvalidArgument);
  ExecutorSession session(executor, session_config(5));
  auto r = test::run_coro(session.ensure_connected());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(executor.attempts(), 1);
  EXPECT_EQ(session.health(), ExecutorHealth::Unhealthy);
}

TEST(ExecutorSessionTest, RecoversAfterLocalBackendReturns) {
  LocalExecutor executor(ExecutorConfig{.threads = 1});
  ExecutorSession session(executor, session_config(2));
  executor.set_available(false);
  EXPECT_FALSE(test::run_coro(session.ensure_connected()).has_value());
  EXPECT_EQ(session.health(), ExecutorHealth::Unhealthy);

  executor.set_available(true);
  EXPECT_TRUE(test::run_coro(session.ensure_connected()));
  EXPECT_EQ(session.health(), ExecutorHealth::Healthy);

  session.disconnect();
  EXPECT_FALSE(executor.connected());
}
