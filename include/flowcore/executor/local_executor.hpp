#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/executor/executor.hpp"
#include "flowcore/store/cluster_memory.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace flowcore {

// Runs stage callables on an in-process thread pool. A "session" is the span
// between connect() and disconnect(); its ClusterMemory lives exactly that
// long.
class LocalExecutor final : public IExecutor {
public:
  explicit LocalExecutor(const ExecutorConfig &config,
                         std::uint64_t max_entry_bytes = 0);
  ~LocalExecutor() override;

  LocalExecutor(const LocalExecutor &) = delete;
  LocalExecutor &operator=(const LocalExecutor &) = delete;

  [[nodiscard]] auto start(StageRequest request, StageCompletion on_complete)
      -> Result<void> override;

  [[nodiscard]] auto connect() -> Result<void> override;
  auto disconnect() -> void override;
  [[nodiscard]] auto connected() const noexcept -> bool override;
  [[nodiscard]] auto shared_memory() -> std::shared_ptr<ClusterMemory> override;

  // Simulates losing the backend: while unavailable, connect() reports
  // ExecutorUnavailable and shared memory is withheld.
  auto set_available(bool available) -> void;

  // Waits for every dispatched stage to return. Later starts are refused.
  auto shutdown() -> void;
  [[nodiscard]] auto threads() const noexcept -> unsigned { return threads_; }

private:
  unsigned threads_;
  std::uint64_t max_entry_bytes_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> available_{true};
  std::atomic<bool> connected_{false};
  std::atomic<bool> shut_down_{false};
  mutable std::mutex memory_mu_;
  std::shared_ptr<ClusterMemory> memory_;
};

} // namespace flowcore
