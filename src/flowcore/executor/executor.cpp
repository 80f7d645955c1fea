#include "flowcore/executor/executor.hpp"

#include "flowcore/core/asio_awaitable.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>

namespace flowcore {

auto invoke_many(IExecutor &executor, StageFunction fn, StageContext context,
                 std::vector<StageArgs> arg_lists, StageResources resources)
    -> task<std::vector<StageResult>> {
  const auto n = arg_lists.size();
  if (n == 0) {
    co_return std::vector<StageResult>{};
  }
  auto results = std::make_shared<std::vector<StageResult>>(n);

  auto ex = co_await boost::asio::this_coro::executor;
  using DoneChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, std::size_t)>;
  auto done = std::make_shared<DoneChannel>(ex, n);

  for (std::size_t i = 0; i < n; ++i) {
    StageRequest req{.fn = fn,
                     .context = context,
                     .args = std::move(arg_lists[i]),
                     .resources = resources};
    req.context.element_index = i;
    req.context.element_count = n;
    co_spawn(
        ex,
        [&executor, results, done, i,
         req = std::move(req)]() mutable -> spawn_task {
          (*results)[i] = co_await invoke(executor, std::move(req));
          // Capacity is n, so this never drops.
          (void)done->try_send(boost::system::error_code{}, i);
        },
        detached);
  }

  for (std::size_t received = 0; received < n; ++received) {
    auto [ec, idx] = co_await done->async_receive(use_nothrow);
    if (ec) {
      break;
    }
  }
  co_return std::move(*results);
}

} // namespace flowcore
