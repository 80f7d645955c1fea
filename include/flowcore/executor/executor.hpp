#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/dag/workflow.hpp"
#include "flowcore/run/run_context.hpp"
#include "flowcore/util/enum.hpp"
#include "flowcore/util/json.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace flowcore {

class ClusterMemory;

enum class ExecutorHealth : std::uint8_t { Healthy, Degraded, Unhealthy };
BOOST_DESCRIBE_ENUM(ExecutorHealth, Healthy, Degraded, Unhealthy)
FLOWCORE_DEFINE_ENUM_SERDE(ExecutorHealth)

struct StageRequest {
  StageFunction fn;
  StageContext context;
  StageArgs args;
  StageResources resources;
};

struct StageResult {
  JsonValue output;
  std::error_code error;
  std::string message;
  bool timed_out{false};
  // False when the executor refused the request before running it.
  bool started{true};

  [[nodiscard]] auto ok() const noexcept -> bool { return !error; }

  [[nodiscard]] static auto failure(std::error_code ec, std::string message)
      -> StageResult {
    StageResult r;
    r.error = ec;
    r.message = std::move(message);
    return r;
  }
};

using StageCompletion = std::move_only_function<void(StageResult)>;

// Backend that runs stage invocations. start() must not block; the
// completion may fire on any thread.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto start(StageRequest request,
                                   StageCompletion on_complete)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto connect() -> Result<void> = 0;
  virtual auto disconnect() -> void = 0;
  [[nodiscard]] virtual auto connected() const noexcept -> bool = 0;

  // Memory shared by every worker of the current session, or null when
  // there is no session. Holders keep it alive across a disconnect().
  [[nodiscard]] virtual auto shared_memory() -> std::shared_ptr<ClusterMemory> = 0;
};

/// Run one stage and resume the awaiting coroutine on its own executor.
inline auto invoke(IExecutor &executor, StageRequest request)
    -> task<StageResult> {
  auto result =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(StageResult)>(
          [&executor, req = std::move(request)](auto handler) mutable {
            auto resume_on = boost::asio::get_associated_executor(handler);
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));
            auto complete = [shared_h, resume_on](StageResult res) mutable {
              boost::asio::dispatch(
                  resume_on, [shared_h, res = std::move(res)]() mutable {
                    std::move (*shared_h)(std::move(res));
                  });
            };

            auto start_res = executor.start(std::move(req), complete);
            if (!start_res) {
              // start() failed before scheduling; the completion never fires.
              auto refused = StageResult::failure(start_res.error(),
                                                  start_res.error().message());
              refused.started = false;
              complete(std::move(refused));
            }
          },
          boost::asio::use_awaitable);

  co_return result;
}

/// Run `fn` once per argument list. Output i always corresponds to input i,
/// whatever order the executor finishes them in.
auto invoke_many(IExecutor &executor, StageFunction fn, StageContext context,
                 std::vector<StageArgs> arg_lists, StageResources resources)
    -> task<std::vector<StageResult>>;

} // namespace flowcore
