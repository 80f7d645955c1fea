#include "flowcore/core/runtime.hpp"

#include "flowcore/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <thread>

namespace flowcore {

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(1U, std::thread::hardware_concurrency());
  }
  num_shards_ = num_shards;

  shards_.reserve(num_shards_);
  work_guards_.resize(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = shards_[i]->ctx();
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    shards_[i]->ctx().stop();
  }

  // jthread joins on destruction
  threads_.clear();
  log::debug("Runtime stopped");
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return detail::current_runtime == this &&
         detail::current_shard_id != kInvalidShard;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  shards_[id]->ctx().run();

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

} // namespace flowcore
