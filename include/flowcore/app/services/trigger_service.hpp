#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/core/shard.hpp"
#include "flowcore/trigger/schedule_clock.hpp"
#include "flowcore/trigger/trigger_engine.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace flowcore {

class EventBus;
class EventStream;
class ExecutionCoordinator;
class IDefinitionStore;
class Runtime;

// Feeds the trigger engine from the event bus and the schedule clock and
// turns fired rules into coordinator submissions.
class TriggerService {
public:
  TriggerService(Runtime &runtime, ExecutionCoordinator &coordinator,
                 std::shared_ptr<EventBus> bus, TriggerConfig config,
                 shard_id shard = 0);
  ~TriggerService();

  TriggerService(const TriggerService &) = delete;
  auto operator=(const TriggerService &) -> TriggerService & = delete;

  // Registers every trigger rule of `store` and follows its changes until
  // detach(). Returns the number of rules registered enabled.
  auto attach(IDefinitionStore &store) -> std::size_t;
  auto detach() -> void;

  auto set_watermark_callbacks(ScheduleClock::LoadWatermark load,
                               ScheduleClock::SaveWatermark save) -> void;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto engine() noexcept -> TriggerEngine & { return engine_; }
  [[nodiscard]] auto clock() noexcept -> ScheduleClock & { return clock_; }

private:
  auto submit(RunRequest request) -> void;
  auto on_definition_changed(const DefinitionChange &change) -> void;
  auto event_loop(std::shared_ptr<EventStream> stream) -> spawn_task;
  auto clock_loop() -> spawn_task;

  Runtime &runtime_;
  ExecutionCoordinator &coordinator_;
  std::shared_ptr<EventBus> bus_;
  shard_id shard_;
  TriggerEngine engine_;
  ScheduleClock clock_;

  std::mutex mu_;
  IDefinitionStore *store_{nullptr};
  std::optional<std::uint64_t> subscription_;
  std::shared_ptr<EventStream> stream_;

  std::atomic<bool> running_{false};
  std::atomic<int> loops_inflight_{0};
};

} // namespace flowcore
