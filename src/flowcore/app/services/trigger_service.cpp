#include "flowcore/app/services/trigger_service.hpp"

#include "flowcore/app/services/execution_coordinator.hpp"
#include "flowcore/core/runtime.hpp"
#include "flowcore/definitions/definition_store.hpp"
#include "flowcore/events/event_bus.hpp"
#include "flowcore/util/log.hpp"

#include <boost/asio/post.hpp>

#include <chrono>
#include <thread>
#include <utility>

namespace flowcore {

TriggerService::TriggerService(Runtime &runtime,
                               ExecutionCoordinator &coordinator,
                               std::shared_ptr<EventBus> bus,
                               TriggerConfig config, shard_id shard)
    : runtime_(runtime), coordinator_(coordinator), bus_(bus), shard_(shard),
      engine_(config, {}, std::move(bus)),
      clock_([this](const TickWindow &window) {
        (void)engine_.on_tick(window);
      }) {
  engine_.set_submit([this](RunRequest request) { submit(std::move(request)); });
}

TriggerService::~TriggerService() {
  stop();
  detach();
}

auto TriggerService::submit(RunRequest request) -> void {
  SubmitOptions options{.input = std::move(request.input),
                        .ns = std::move(request.ns),
                        .source = request.source};
  auto handle = coordinator_.submit(request.workflow, std::move(options));
  if (!handle) {
    log::error("Rule {} could not start workflow {}: {}", request.rule,
               request.workflow, handle.error().message());
    return;
  }
  log::info("Rule {} started run {} (correlation {})", request.rule,
            handle->name(), request.correlation_id);
}

auto TriggerService::attach(IDefinitionStore &store) -> std::size_t {
  detach();
  std::size_t enabled = 0;
  for (auto &definition : store.list_triggers()) {
    if (engine_.register_rule(std::move(definition))) {
      ++enabled;
    }
  }
  auto id = store.subscribe(
      [this](const DefinitionChange &change) { on_definition_changed(change); });
  {
    std::lock_guard lock(mu_);
    store_ = &store;
    subscription_ = id;
  }
  log::info("Trigger service attached: {} rule(s) enabled of {}", enabled,
            engine_.size());
  return enabled;
}

auto TriggerService::detach() -> void {
  IDefinitionStore *store = nullptr;
  std::optional<std::uint64_t> id;
  {
    std::lock_guard lock(mu_);
    store = std::exchange(store_, nullptr);
    id = std::exchange(subscription_, std::nullopt);
  }
  if (store != nullptr && id) {
    store->unsubscribe(*id);
  }
}

auto TriggerService::on_definition_changed(const DefinitionChange &change)
    -> void {
  if (change.kind != DefinitionKind::TriggerRule) {
    return;
  }
  if (change.removed) {
    if (auto r = engine_.unregister_rule(change.name); !r) {
      log::debug("Removed rule {} was not registered", change.name);
    }
    return;
  }

  IDefinitionStore *store = nullptr;
  {
    std::lock_guard lock(mu_);
    store = store_;
  }
  if (store == nullptr) {
    return;
  }
  auto definition = store->get_trigger(change.name);
  if (!definition) {
    log::warn("Rule {} changed but is no longer in the store", change.name);
    return;
  }
  // A malformed rule is logged and kept disabled by the engine.
  (void)engine_.register_rule(std::move(*definition));
}

auto TriggerService::set_watermark_callbacks(
    ScheduleClock::LoadWatermark load, ScheduleClock::SaveWatermark save)
    -> void {
  clock_.set_load_watermark(std::move(load));
  clock_.set_save_watermark(std::move(save));
}

auto TriggerService::start() -> Result<void> {
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return fail(Error::AlreadyExists);
  }

  if (bus_) {
    auto stream = std::make_shared<EventStream>(
        bus_->subscribe(runtime_.executor_for(shard_), {},
                        EventBus::kDefaultCapacity, Delivery::Reliable));
    {
      std::lock_guard lock(mu_);
      stream_ = stream;
    }
    loops_inflight_.fetch_add(1, std::memory_order_acq_rel);
    runtime_.spawn_on(shard_, event_loop(std::move(stream)));
  }
  loops_inflight_.fetch_add(1, std::memory_order_acq_rel);
  runtime_.spawn_on(shard_, clock_loop());
  log::info("Trigger service started on shard {}", shard_);
  return ok();
}

auto TriggerService::event_loop(std::shared_ptr<EventStream> stream)
    -> spawn_task {
  while (running_.load(std::memory_order_acquire)) {
    auto event = co_await stream->next();
    if (!event) {
      break;
    }
    (void)engine_.on_event(*event);
  }
  log::debug("Trigger event loop exited");
  loops_inflight_.fetch_sub(1, std::memory_order_acq_rel);
}

auto TriggerService::clock_loop() -> spawn_task {
  if (running_.load(std::memory_order_acquire)) {
    co_await clock_.run();
  }
  loops_inflight_.fetch_sub(1, std::memory_order_acq_rel);
}

auto TriggerService::stop() noexcept -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  std::shared_ptr<EventStream> stream;
  {
    std::lock_guard lock(mu_);
    stream = std::exchange(stream_, nullptr);
  }
  if (stream) {
    runtime_.post_to(shard_, [stream] { stream->close(); });
  }
  clock_.stop();

  // Both loops reference this service; give them a moment to unwind before
  // the members go away.
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
  while (loops_inflight_.load(std::memory_order_acquire) > 0 &&
         runtime_.is_running() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  log::info("Trigger service stopped");
}

} // namespace flowcore
