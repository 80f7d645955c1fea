#include "flowcore/app/services/execution_coordinator.hpp"

#include "flowcore/core/asio_awaitable.hpp"
#include "flowcore/core/runtime.hpp"
#include "flowcore/definitions/definition_store.hpp"
#include "flowcore/events/event.hpp"
#include "flowcore/events/event_bus.hpp"
#include "flowcore/executor/executor_session.hpp"
#include "flowcore/executor/target_registry.hpp"
#include "flowcore/util/hash.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/util.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>
#include <ranges>
#include <variant>

namespace flowcore {
namespace detail {

struct StageSignal {
  NodeIndex stage{kInvalidNode};
  std::optional<std::size_t> element;
  StageResult result;
};
struct CancelSignal {};
struct RunTimeoutSignal {};

using RunSignal = std::variant<StageSignal, CancelSignal, RunTimeoutSignal>;
using SignalChannel = boost::asio::experimental::concurrent_channel<void(
    boost::system::error_code, RunSignal)>;

inline constexpr std::size_t kSignalCapacity = 256;
// Resubmissions of one stage to an executor that keeps dropping between
// connect and start.
inline constexpr int kMaxRedispatch = 8;

enum class StageStatus : std::uint8_t { Pending, Running, Done };

// Results of a parameterized stage, slotted by source index.
struct FanOut {
  std::vector<std::optional<JsonValue>> slots;
  std::size_t received{0};
};

} // namespace detail

struct ExecutionCoordinator::RunControl {
  boost::asio::any_io_executor executor;
  std::shared_ptr<std::atomic<bool>> cancelled;
  std::shared_ptr<detail::SignalChannel> signals;
};

// Stage bookkeeping of one run. Only touched on the run's owner shard.
struct ExecutionCoordinator::ActiveRun {
  WorkflowRun run;
  CompiledGraph graph;
  std::vector<StageFunction> fns;
  std::shared_ptr<const RunContext> context;
  std::shared_ptr<RunControl> control;
  std::shared_ptr<RunCompletion> completion;
  std::vector<detail::StageStatus> status;
  std::vector<std::size_t> pending_deps;
  std::vector<JsonValue> outputs;
  std::vector<detail::FanOut> fanouts;
  std::size_t done_count{0};
  std::shared_ptr<boost::asio::steady_timer> run_timer;

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(run.state);
  }
};

ExecutionCoordinator::ExecutionCoordinator(Dependencies deps,
                                           ComputeConfig config)
    : runtime_(deps.runtime), session_(deps.session), targets_(deps.targets),
      store_(deps.store), bus_(std::move(deps.bus)),
      definitions_(deps.definitions), config_(std::move(config)) {}

ExecutionCoordinator::~ExecutionCoordinator() = default;

auto ExecutionCoordinator::owner_shard(const RunId &id) const noexcept
    -> shard_id {
  return static_cast<shard_id>(
      util::shard_of(id.value(), runtime_.shard_count()));
}

auto ExecutionCoordinator::submit(std::string_view workflow,
                                  SubmitOptions options) -> Result<RunHandle> {
  if (definitions_ == nullptr) {
    log::warn("Cannot submit {}: no definition store attached", workflow);
    return fail(Error::InvalidState);
  }
  auto definition = definitions_->get_workflow(workflow);
  if (!definition) {
    log::warn("Cannot submit {}: workflow not found", workflow);
    return fail(definition.error());
  }
  return submit(std::move(*definition), std::move(options));
}

auto ExecutionCoordinator::submit(
    std::shared_ptr<const WorkflowDefinition> workflow, SubmitOptions options)
    -> Result<RunHandle> {
  if (!workflow) {
    return fail(Error::InvalidArgument);
  }
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }
  purge_expired();

  CompileDiagnostic diagnostic;
  auto graph = compile(workflow, &diagnostic);
  if (!graph) {
    log::warn("Workflow {} rejected: {}", workflow->name, diagnostic.message);
    return fail(graph.error());
  }

  std::vector<StageFunction> fns;
  fns.reserve(graph->size());
  for (const auto *stage : graph->stages) {
    auto fn = targets_.resolve(stage->target);
    if (!fn) {
      log::warn("Workflow {} rejected: stage {} target '{}' does not resolve",
                workflow->name, stage->name, stage->target);
      return fail(fn.error());
    }
    fns.push_back(std::move(*fn));
  }

  auto id = generate_run_id();
  const auto owner = owner_shard(id);

  WorkflowRun run{
      .uid = id,
      .name = std::format("{}-{}", workflow->name,
                          detail::generate_short_uuid()),
      .workflow = workflow->name,
      .ns = options.ns.value_or(config_.default_namespace),
      .source = options.source,
      .input = options.input.is_null() ? make_object()
                                       : std::move(options.input),
      .started_at = std::chrono::system_clock::now(),
  };

  auto control = std::make_shared<RunControl>();
  control->executor = runtime_.executor_for(owner);
  control->cancelled = std::make_shared<std::atomic<bool>>(false);
  control->signals = std::make_shared<detail::SignalChannel>(
      control->executor, detail::kSignalCapacity);

  auto context = std::make_shared<RunContext>();
  context->run_id = run.uid;
  context->run_name = run.name;
  context->workflow = run.workflow;
  context->ns = run.ns;
  context->source = run.source;
  context->started_at = run.started_at;
  context->input = run.input;
  context->config = definitions_ != nullptr
                        ? definitions_->configs_for(*workflow)
                        : make_object();
  context->definition = workflow;
  context->executor = &session_.executor();
  context->store = store_;
  context->cancelled = control->cancelled;

  const auto n = graph->size();
  auto active = std::make_shared<ActiveRun>();
  active->run = run;
  active->graph = std::move(*graph);
  active->fns = std::move(fns);
  active->context = std::move(context);
  active->control = control;
  active->completion = std::make_shared<RunCompletion>();
  active->status.assign(n, detail::StageStatus::Pending);
  active->outputs.resize(n);
  active->fanouts.resize(n);
  active->pending_deps.resize(n);
  for (NodeIndex i = 0; i < n; ++i) {
    active->pending_deps[i] = active->graph.dag.get_deps_view(i).size();
  }

  RunHandle handle{run.uid, run.name, active->completion};
  {
    std::lock_guard lock(records_mu_);
    records_.insert_or_assign(
        run.uid, RunRecord{.snapshot = run,
                           .completion = active->completion,
                           .control = std::move(control)});
  }
  active_runs_.fetch_add(1, std::memory_order_acq_rel);
  log::info("Run {} submitted: workflow={} namespace={} source={}", run.name,
            run.workflow, run.ns, to_string_view(run.source));

  runtime_.spawn_on(owner, drive(std::move(active)));
  return ok(std::move(handle));
}

auto ExecutionCoordinator::drive(std::shared_ptr<ActiveRun> active)
    -> spawn_task {
  auto &run = *active;
  auto ex = co_await boost::asio::this_coro::executor;
  log::info("Run {} started with {} stage(s)", run.run.name,
            run.graph.size());
  publish(kWorkflowStartedEvent, run.run);

  if (config_.run_timeout_ms > 0) {
    run.run_timer = std::make_shared<boost::asio::steady_timer>(
        ex, std::chrono::milliseconds(config_.run_timeout_ms));
    co_spawn(
        ex,
        [timer = run.run_timer, control = run.control]() -> spawn_task {
          auto [ec] = co_await timer->async_wait(use_nothrow);
          if (ec) {
            co_return;
          }
          auto [send_ec] = co_await control->signals->async_send(
              boost::system::error_code{},
              detail::RunSignal{detail::RunTimeoutSignal{}}, use_nothrow);
          if (send_ec) {
            log::debug("Run timeout raced with completion: {}",
                       send_ec.message());
          }
        },
        detached);
  }

  co_await dispatch_ready(active);

  while (!run.terminal()) {
    auto [ec, signal] =
        co_await run.control->signals->async_receive(use_nothrow);
    if (ec) {
      fail_run(run, make_error_code(Error::Cancelled),
               std::format("signal channel closed: {}", ec.message()), {});
      break;
    }

    bool progressed = std::visit(
        overloaded{
            [&](detail::StageSignal &s) -> bool {
              const auto &stage = run.graph.stage(s.stage);
              if (run.status[s.stage] != detail::StageStatus::Running) {
                log::debug("Run {}: discarding late result of stage {}",
                           run.run.name, stage.name);
                return false;
              }
              if (!s.result.ok()) {
                fail_run(run, s.result.error, std::move(s.result.message),
                         stage.name);
                return false;
              }
              if (!s.element) {
                complete_stage(run, s.stage, std::move(s.result.output));
                return true;
              }
              auto &fan = run.fanouts[s.stage];
              auto &slot = fan.slots[*s.element];
              if (!slot) {
                slot = std::move(s.result.output);
                ++fan.received;
              }
              if (fan.received < fan.slots.size()) {
                return false;
              }
              auto funnel = make_array();
              auto &items = funnel.get_array();
              items.reserve(fan.slots.size());
              for (auto &value : fan.slots) {
                items.push_back(std::move(*value));
              }
              fan.slots.clear();
              complete_stage(run, s.stage, std::move(funnel));
              return true;
            },
            [&](detail::CancelSignal) -> bool {
              log::info("Run {} cancelled", run.run.name);
              finish(run, RunState::Cancelled,
                     JsonValue{{"error", std::string(error_kind(
                                             make_error_code(Error::Cancelled)))},
                               {"message", "run cancelled"},
                               {"stage", nullptr}});
              return false;
            },
            [&](detail::RunTimeoutSignal) -> bool {
              fail_run(run, make_error_code(Error::Timeout),
                       std::format("run exceeded {}ms", config_.run_timeout_ms),
                       {});
              return false;
            },
        },
        signal);

    if (progressed && !run.terminal()) {
      co_await dispatch_ready(active);
    }
  }
}

auto ExecutionCoordinator::dispatch_ready(std::shared_ptr<ActiveRun> active)
    -> task<void> {
  auto &run = *active;
  std::vector<NodeIndex> ready;
  for (auto idx : run.graph.order) {
    if (run.status[idx] == detail::StageStatus::Pending &&
        run.pending_deps[idx] == 0) {
      ready.push_back(idx);
    }
  }
  if (ready.empty() || run.terminal() ||
      run.control->cancelled->load(std::memory_order_acquire)) {
    co_return;
  }
  std::ranges::stable_sort(ready, std::ranges::greater{}, [&](NodeIndex idx) {
    return run.graph.stage(idx).priority;
  });

  if (auto connected = co_await session_.ensure_connected(); !connected) {
    fail_run(run, connected.error(),
             std::format("executor unavailable: {}",
                         connected.error().message()),
             run.graph.stage(ready.front()).name);
    co_return;
  }

  for (auto idx : ready) {
    if (run.terminal() ||
        run.control->cancelled->load(std::memory_order_acquire)) {
      break;
    }
    dispatch_stage(active, idx);
  }
}

auto ExecutionCoordinator::dispatch_stage(
    const std::shared_ptr<ActiveRun> &active, NodeIndex idx) -> void {
  auto &run = *active;
  const auto &stage = run.graph.stage(idx);
  run.status[idx] = detail::StageStatus::Running;

  StageArgs upstream;
  upstream.reserve(stage.depends_on.size());
  for (const auto &dep : stage.depends_on) {
    upstream.push_back(run.outputs[run.graph.dag.get_index(dep)]);
  }

  if (!stage.is_parameterized()) {
    StageArgs args =
        upstream.empty() ? StageArgs{run.run.input} : std::move(upstream);
    log::debug("Run {}: dispatching stage {}", run.run.name, stage.name);
    runtime_.spawn_on(owner_shard(run.run.uid),
                      invoke_stage(active, idx, std::nullopt, 1,
                                   std::move(args)));
    return;
  }

  // The iterable comes from the run input when map_on names a key, else from
  // the first upstream result (or the input for a root stage). Remaining
  // upstream results follow each element as extra arguments.
  JsonValue iterable;
  StageArgs extra;
  if (stage.map_on) {
    const auto *found = json::find_path(run.run.input, *stage.map_on);
    if (found == nullptr) {
      fail_run(run, make_error_code(Error::ExecutionFailed),
               std::format("input has no '{}' to map over", *stage.map_on),
               stage.name);
      return;
    }
    iterable = *found;
    extra = std::move(upstream);
  } else if (upstream.empty()) {
    iterable = run.run.input;
  } else {
    iterable = std::move(upstream.front());
    extra.assign(std::make_move_iterator(upstream.begin() + 1),
                 std::make_move_iterator(upstream.end()));
  }

  const auto *items = json::as_array(iterable);
  if (items == nullptr) {
    fail_run(run, make_error_code(Error::ExecutionFailed),
             std::format("parameterized stage expects a list, got {}",
                         dump_json(iterable)),
             stage.name);
    return;
  }

  const auto n = items->size();
  run.fanouts[idx].slots.assign(n, std::nullopt);
  run.fanouts[idx].received = 0;
  log::debug("Run {}: dispatching stage {} over {} element(s)", run.run.name,
             stage.name, n);

  if (n == 0) {
    StageResult empty;
    empty.output = make_array();
    co_spawn(
        run.control->executor,
        [control = run.control, idx,
         empty = std::move(empty)]() mutable -> spawn_task {
          auto [ec] = co_await control->signals->async_send(
              boost::system::error_code{},
              detail::RunSignal{detail::StageSignal{
                  .stage = idx, .element = std::nullopt, .result = std::move(empty)}},
              use_nothrow);
          if (ec) {
            log::debug("Empty fan-out signal dropped: {}", ec.message());
          }
        },
        detached);
    return;
  }

  for (std::size_t i = 0; i < n; ++i) {
    StageArgs args;
    args.reserve(extra.size() + 1);
    args.push_back((*items)[i]);
    std::ranges::copy(extra, std::back_inserter(args));
    runtime_.spawn_on(owner_shard(run.run.uid),
                      invoke_stage(active, idx, i, n, std::move(args)));
  }
}

auto ExecutionCoordinator::invoke_stage(std::shared_ptr<ActiveRun> active,
                                        NodeIndex idx,
                                        std::optional<std::size_t> element,
                                        std::size_t count, StageArgs args)
    -> spawn_task {
  const auto &stage = active->graph.stage(idx);
  StageRequest request{.fn = active->fns[idx],
                       .context = StageContext{.run = active->context,
                                               .stage = stage.name,
                                               .element_index = element,
                                               .element_count = count},
                       .args = std::move(args),
                       .resources = stage.resources};
  auto control = active->control;
  active.reset();

  auto ex = co_await boost::asio::this_coro::executor;
  auto settled = std::make_shared<bool>(false);
  auto send = [control, idx, element](StageResult result) -> spawn_task {
    auto [ec] = co_await control->signals->async_send(
        boost::system::error_code{},
        detail::RunSignal{detail::StageSignal{
            .stage = idx, .element = element, .result = std::move(result)}},
        use_nothrow);
    if (ec) {
      log::debug("Stage result dropped after run ended: {}", ec.message());
    }
  };

  std::shared_ptr<boost::asio::steady_timer> timer;
  if (config_.stage_timeout_ms > 0) {
    const auto limit = std::chrono::milliseconds(config_.stage_timeout_ms);
    timer = std::make_shared<boost::asio::steady_timer>(ex, limit);
    co_spawn(
        ex,
        [timer, settled, send, limit]() -> spawn_task {
          auto [ec] = co_await timer->async_wait(use_nothrow);
          if (ec || *settled) {
            co_return;
          }
          *settled = true;
          auto result = StageResult::failure(
              make_error_code(Error::Timeout),
              std::format("stage timed out after {}ms", limit.count()));
          result.timed_out = true;
          co_await send(std::move(result));
        },
        detached);
  }

  // Connectivity lost after dispatch_ready() connected: reconnect through
  // the session and resubmit, failing only once its budget is spent.
  auto result = co_await invoke(session_.executor(), request);
  for (int attempt = 1;
       !result.started &&
       result.error == make_error_code(Error::ExecutorUnavailable) &&
       attempt <= detail::kMaxRedispatch && !*settled &&
       !control->cancelled->load(std::memory_order_acquire);
       ++attempt) {
    log::warn("Stage {} refused by executor, reconnecting (attempt {})",
              request.context.stage, attempt);
    if (auto connected = co_await session_.ensure_connected(); !connected) {
      result = StageResult::failure(
          connected.error(),
          std::format("executor unavailable: {}", connected.error().message()));
      break;
    }
    result = co_await invoke(session_.executor(), request);
  }
  if (timer) {
    timer->cancel();
  }
  if (*settled) {
    co_return;
  }
  *settled = true;
  co_await send(std::move(result));
}

auto ExecutionCoordinator::complete_stage(ActiveRun &run, NodeIndex idx,
                                          JsonValue output) -> void {
  run.status[idx] = detail::StageStatus::Done;
  run.outputs[idx] = std::move(output);
  ++run.done_count;
  log::debug("Run {}: stage {} completed", run.run.name,
             run.graph.stage(idx).name);

  for (auto dependent : run.graph.dag.get_dependents_view(idx)) {
    --run.pending_deps[dependent];
  }
  if (run.done_count == run.graph.size()) {
    finish(run, RunState::Completed, run.outputs[run.graph.result_stage]);
  }
}

auto ExecutionCoordinator::fail_run(ActiveRun &run, std::error_code ec,
                                    std::string message, std::string_view stage)
    -> void {
  if (run.terminal()) {
    return;
  }
  if (stage.empty()) {
    log::error("Run {} failed: {}", run.run.name, message);
  } else {
    log::error("Run {} failed at stage {}: {}", run.run.name, stage, message);
  }
  JsonValue result{{"error", std::string(error_kind(ec))},
                   {"message", std::move(message)},
                   {"stage", nullptr}};
  if (!stage.empty()) {
    result.get_object()["stage"] = std::string(stage);
  }
  finish(run, RunState::Failed, std::move(result));
}

auto ExecutionCoordinator::finish(ActiveRun &run, RunState state,
                                  JsonValue result) -> void {
  if (!run.run.finish(state, std::move(result))) {
    return;
  }
  if (run.run_timer) {
    run.run_timer->cancel();
  }
  run.control->signals->close();
  active_runs_.fetch_sub(1, std::memory_order_acq_rel);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      run.run.finished_at - run.run.started_at);
  log::info("Run {} finished: {} in {}ms", run.run.name,
            to_string_view(run.run.state), elapsed.count());

  record_snapshot(run.run);
  publish(kWorkflowFinishedEvent, run.run);
  run.completion->complete(run.run);
}

auto ExecutionCoordinator::publish(std::string_view type,
                                   const WorkflowRun &run) -> void {
  if (!bus_) {
    return;
  }
  auto event =
      make_event(kWorkflowChannel, kCoordinatorSource, type, to_json(run));
  event.correlation_id = run.uid.str();
  bus_->publish(std::move(event));
}

auto ExecutionCoordinator::record_snapshot(const WorkflowRun &run) -> void {
  std::lock_guard lock(records_mu_);
  if (auto it = records_.find(run.uid); it != records_.end()) {
    it->second.snapshot = run;
  }
}

auto ExecutionCoordinator::purge_expired() -> void {
  const auto cutoff = std::chrono::system_clock::now() -
                      std::chrono::seconds(config_.run_retention_seconds);
  std::lock_guard lock(records_mu_);
  std::vector<RunId> expired;
  for (const auto &[id, record] : records_) {
    if (is_terminal(record.snapshot.state) &&
        record.snapshot.finished_at <= cutoff) {
      expired.push_back(id);
    }
  }
  for (const auto &id : expired) {
    records_.erase(id);
  }
  if (!expired.empty()) {
    log::debug("Purged {} expired run(s)", expired.size());
  }
}

auto ExecutionCoordinator::get_run(const RunId &id) -> Result<WorkflowRun> {
  purge_expired();
  std::lock_guard lock(records_mu_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second.snapshot);
}

auto ExecutionCoordinator::handle(const RunId &id) -> Result<RunHandle> {
  std::lock_guard lock(records_mu_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return fail(Error::NotFound);
  }
  return ok(RunHandle{id, it->second.snapshot.name, it->second.completion});
}

auto ExecutionCoordinator::list_runs() -> std::vector<WorkflowRun> {
  purge_expired();
  std::vector<WorkflowRun> out;
  {
    std::lock_guard lock(records_mu_);
    out.reserve(records_.size());
    for (const auto &[id, record] : records_) {
      out.push_back(record.snapshot);
    }
  }
  std::ranges::sort(out, {}, &WorkflowRun::started_at);
  return out;
}

auto ExecutionCoordinator::cancel(const RunId &id) -> Result<void> {
  std::shared_ptr<RunControl> control;
  {
    std::lock_guard lock(records_mu_);
    auto it = records_.find(id);
    if (it == records_.end()) {
      return fail(Error::NotFound);
    }
    if (is_terminal(it->second.snapshot.state)) {
      return ok();
    }
    control = it->second.control;
  }
  if (control->cancelled->exchange(true, std::memory_order_acq_rel)) {
    return ok();
  }
  log::info("Cancelling run {}", id);
  co_spawn(
      control->executor,
      [control]() -> spawn_task {
        auto [ec] = co_await control->signals->async_send(
            boost::system::error_code{},
            detail::RunSignal{detail::CancelSignal{}}, use_nothrow);
        if (ec) {
          log::debug("Cancel arrived after the run ended: {}", ec.message());
        }
      },
      detached);
  return ok();
}

auto ExecutionCoordinator::cancel_all() -> void {
  std::vector<RunId> running;
  {
    std::lock_guard lock(records_mu_);
    for (const auto &[id, record] : records_) {
      if (!is_terminal(record.snapshot.state)) {
        running.push_back(id);
      }
    }
  }
  for (const auto &id : running) {
    if (auto r = cancel(id); !r) {
      log::debug("Run {} already gone: {}", id, r.error().message());
    }
  }
}

} // namespace flowcore
