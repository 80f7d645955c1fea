#include "flowcore/run/run_handle.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/dispatch.hpp>

namespace flowcore {

auto RunCompletion::complete(const WorkflowRun &run) -> void {
  std::vector<std::move_only_function<void(const WorkflowRun &)>> waiters;
  {
    std::lock_guard lock(mu_);
    if (result_) {
      return;
    }
    result_ = run;
    waiters.swap(waiters_);
  }
  cv_.notify_all();
  for (auto &waiter : waiters) {
    waiter(run);
  }
}

auto RunCompletion::result() const -> std::optional<WorkflowRun> {
  std::lock_guard lock(mu_);
  return result_;
}

auto RunCompletion::wait_for(std::chrono::milliseconds timeout) const
    -> std::optional<WorkflowRun> {
  std::unique_lock lock(mu_);
  cv_.wait_for(lock, timeout, [this] { return result_.has_value(); });
  return result_;
}

auto RunCompletion::async_wait() -> task<WorkflowRun> {
  co_return co_await boost::asio::async_initiate<
      const boost::asio::use_awaitable_t<>, void(WorkflowRun)>(
      [this](auto handler) {
        auto resume_on = boost::asio::get_associated_executor(handler);
        auto shared_h = std::make_shared<decltype(handler)>(std::move(handler));
        auto deliver = [shared_h, resume_on](const WorkflowRun &run) {
          boost::asio::dispatch(resume_on, [shared_h, run]() mutable {
            std::move (*shared_h)(std::move(run));
          });
        };

        std::unique_lock lock(mu_);
        if (result_) {
          auto run = *result_;
          lock.unlock();
          deliver(run);
          return;
        }
        waiters_.emplace_back(std::move(deliver));
      },
      boost::asio::use_awaitable);
}

} // namespace flowcore
