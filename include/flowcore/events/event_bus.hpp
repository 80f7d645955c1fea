#pragma once

#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/events/event.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace flowcore {

using EventPredicate = std::function<bool(const Event &)>;
using EventChannel = boost::asio::experimental::concurrent_channel<void(
    boost::system::error_code, Event)>;

class EventBus;

// What happens to an event published while a subscriber's buffer is full.
enum class Delivery : std::uint8_t {
  // The subscriber loses the event and the loss is counted.
  Lossy,
  // The event waits in an unbounded backlog that drains into the buffer as
  // the subscriber reads, in publish order.
  Reliable,
};

// Filtered stream of events. Destroying the stream unsubscribes it.
class EventStream {
public:
  EventStream(const EventStream &) = delete;
  EventStream &operator=(const EventStream &) = delete;
  EventStream(EventStream &&) noexcept = default;
  EventStream &operator=(EventStream &&) noexcept = default;
  ~EventStream();

  // Completes with Cancelled once the stream or the bus is closed.
  [[nodiscard]] auto next() -> task<Result<Event>>;
  [[nodiscard]] auto try_next() -> std::optional<Event>;
  auto close() -> void;

private:
  friend class EventBus;

  EventStream(std::weak_ptr<EventBus> bus, std::uint64_t id,
              std::shared_ptr<EventChannel> channel)
      : bus_(std::move(bus)), id_(id), channel_(std::move(channel)) {}

  std::weak_ptr<EventBus> bus_;
  std::uint64_t id_{0};
  std::shared_ptr<EventChannel> channel_;
};

// In-process publish/subscribe. publish() never blocks; a full subscriber
// either loses the event or backlogs it, per its Delivery.
class EventBus : public std::enable_shared_from_this<EventBus> {
public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  [[nodiscard]] static auto create() -> std::shared_ptr<EventBus> {
    return std::shared_ptr<EventBus>(new EventBus());
  }
  ~EventBus();

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  auto publish(Event event) -> void;
  [[nodiscard]] auto subscribe(boost::asio::any_io_executor executor,
                               EventPredicate predicate = {},
                               std::size_t capacity = kDefaultCapacity,
                               Delivery delivery = Delivery::Lossy)
      -> EventStream;
  auto close() -> void;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto subscriber_count() const -> std::size_t;

private:
  friend class EventStream;
  EventBus() = default;
  auto unsubscribe(std::uint64_t id) -> void;

  struct Backlog {
    std::mutex mu;
    std::deque<Event> events;
    bool draining{false};
  };

  struct Subscriber {
    std::uint64_t id;
    EventPredicate predicate;
    std::shared_ptr<EventChannel> channel;
    std::shared_ptr<Backlog> backlog;
  };

  static auto deliver(const Subscriber &sub, const Event &event) -> bool;
  static auto drain(std::shared_ptr<EventChannel> channel,
                    std::shared_ptr<Backlog> backlog) -> spawn_task;

  mutable std::mutex mu_;
  std::vector<Subscriber> subscribers_;
  std::uint64_t next_id_{1};
  bool closed_{false};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace flowcore
