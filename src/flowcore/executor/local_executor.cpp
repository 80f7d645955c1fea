#include "flowcore/executor/local_executor.hpp"

#include "flowcore/util/log.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <thread>

namespace flowcore {
namespace {

auto resolve_threads(int configured) -> unsigned {
  if (configured > 0) {
    return static_cast<unsigned>(configured);
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

// Exceptions never cross the executor boundary; they become ExecutionFailed
// carrying the exception text.
auto run_stage(StageRequest &req) -> StageResult {
  try {
    auto out = req.fn(req.context, req.args);
    if (!out) {
      return StageResult::failure(out.error(), out.error().message());
    }
    StageResult r;
    r.output = std::move(*out);
    return r;
  } catch (const std::exception &e) {
    return StageResult::failure(make_error_code(Error::ExecutionFailed),
                                e.what());
  } catch (...) {
    return StageResult::failure(make_error_code(Error::ExecutionFailed),
                                "stage threw a non-standard exception");
  }
}

} // namespace

LocalExecutor::LocalExecutor(const ExecutorConfig &config,
                             std::uint64_t max_entry_bytes)
    : threads_(resolve_threads(config.threads)),
      max_entry_bytes_(max_entry_bytes), pool_(threads_) {}

LocalExecutor::~LocalExecutor() {
  shutdown();
  disconnect();
}

auto LocalExecutor::shutdown() -> void {
  shut_down_.store(true, std::memory_order_release);
  connected_.store(false, std::memory_order_release);
  pool_.join();
}

auto LocalExecutor::start(StageRequest request, StageCompletion on_complete)
    -> Result<void> {
  if (!connected_.load(std::memory_order_acquire)) {
    return fail(Error::ExecutorUnavailable);
  }
  if (!request.fn) {
    return fail(Error::ResolutionFailed);
  }
  boost::asio::post(pool_, [req = std::move(request),
                            done = std::move(on_complete)]() mutable {
    auto result = run_stage(req);
    done(std::move(result));
  });
  return ok();
}

auto LocalExecutor::connect() -> Result<void> {
  if (shut_down_.load(std::memory_order_acquire)) {
    return fail(Error::InvalidState);
  }
  if (!available_.load(std::memory_order_acquire)) {
    return fail(Error::ExecutorUnavailable);
  }
  std::lock_guard lock(memory_mu_);
  if (!memory_) {
    memory_ = std::make_shared<ClusterMemory>(max_entry_bytes_);
    log::info("Local executor session started ({} threads)", threads_);
  }
  connected_.store(true, std::memory_order_release);
  return ok();
}

auto LocalExecutor::disconnect() -> void {
  std::lock_guard lock(memory_mu_);
  connected_.store(false, std::memory_order_release);
  if (memory_) {
    memory_.reset();
    log::info("Local executor session ended; cluster memory discarded");
  }
}

auto LocalExecutor::connected() const noexcept -> bool {
  return connected_.load(std::memory_order_acquire);
}

auto LocalExecutor::shared_memory() -> std::shared_ptr<ClusterMemory> {
  if (!available_.load(std::memory_order_acquire)) {
    return nullptr;
  }
  std::lock_guard lock(memory_mu_);
  return memory_;
}

auto LocalExecutor::set_available(bool available) -> void {
  available_.store(available, std::memory_order_release);
  if (!available) {
    connected_.store(false, std::memory_order_release);
  }
}

} // namespace flowcore
