#include "flowcore/events/event_bus.hpp"

#include "flowcore/core/asio_awaitable.hpp"
#include "flowcore/util/log.hpp"

#include <algorithm>
#include <utility>

namespace flowcore {

EventStream::~EventStream() { close(); }

auto EventStream::next() -> task<Result<Event>> {
  if (!channel_) {
    co_return fail(Error::Cancelled);
  }
  auto channel = channel_;
  auto [ec, event] = co_await channel->async_receive(use_nothrow);
  if (ec) {
    co_return fail(Error::Cancelled);
  }
  co_return ok(std::move(event));
}

auto EventStream::try_next() -> std::optional<Event> {
  if (!channel_) {
    return std::nullopt;
  }
  std::optional<Event> out;
  (void)channel_->try_receive(
      [&](boost::system::error_code ec, Event event) {
        if (!ec) {
          out = std::move(event);
        }
      });
  return out;
}

auto EventStream::close() -> void {
  if (!channel_) {
    return;
  }
  if (auto bus = bus_.lock()) {
    bus->unsubscribe(id_);
  }
  channel_->close();
  channel_.reset();
}

EventBus::~EventBus() { close(); }

auto EventBus::publish(Event event) -> void {
  std::vector<Subscriber> targets;
  {
    std::lock_guard lock(mu_);
    if (closed_) {
      return;
    }
    for (const auto &sub : subscribers_) {
      if (!sub.predicate || sub.predicate(event)) {
        targets.push_back(sub);
      }
    }
  }
  log::trace("Publishing event {} '{}' on '{}' to {} subscribers", event.id,
             event.type, event.channel, targets.size());
  for (const auto &sub : targets) {
    if (!deliver(sub, event)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      log::warn("Event {} '{}' dropped: subscriber buffer full", event.id,
                event.type);
    }
  }
}

auto EventBus::deliver(const Subscriber &sub, const Event &event) -> bool {
  if (!sub.backlog) {
    return sub.channel->try_send(boost::system::error_code{}, event);
  }
  auto &backlog = *sub.backlog;
  {
    std::lock_guard lock(backlog.mu);
    if (backlog.draining) {
      backlog.events.push_back(event);
      return true;
    }
  }
  if (sub.channel->try_send(boost::system::error_code{}, event)) {
    return true;
  }
  bool spawn = false;
  {
    std::lock_guard lock(backlog.mu);
    backlog.events.push_back(event);
    spawn = !std::exchange(backlog.draining, true);
  }
  if (spawn) {
    log::debug("Event {} '{}' backlogged: subscriber buffer full", event.id,
               event.type);
    co_spawn(sub.channel->get_executor(), drain(sub.channel, sub.backlog),
             detached);
  }
  return true;
}

auto EventBus::drain(std::shared_ptr<EventChannel> channel,
                     std::shared_ptr<Backlog> backlog) -> spawn_task {
  while (true) {
    std::optional<Event> next;
    {
      std::lock_guard lock(backlog->mu);
      if (backlog->events.empty()) {
        backlog->draining = false;
      } else {
        next = std::move(backlog->events.front());
        backlog->events.pop_front();
      }
    }
    if (!next) {
      co_return;
    }
    auto [ec] = co_await channel->async_send(boost::system::error_code{},
                                             std::move(*next), use_nothrow);
    if (ec) {
      std::lock_guard lock(backlog->mu);
      log::debug("Subscriber closed with {} backlogged event(s)",
                 backlog->events.size());
      backlog->events.clear();
      backlog->draining = false;
      co_return;
    }
  }
}

auto EventBus::subscribe(boost::asio::any_io_executor executor,
                         EventPredicate predicate, std::size_t capacity,
                         Delivery delivery) -> EventStream {
  auto channel = std::make_shared<EventChannel>(std::move(executor), capacity);
  std::lock_guard lock(mu_);
  auto id = next_id_++;
  if (closed_) {
    channel->close();
  } else {
    subscribers_.push_back(Subscriber{
        .id = id,
        .predicate = std::move(predicate),
        .channel = channel,
        .backlog = delivery == Delivery::Reliable
                       ? std::make_shared<Backlog>()
                       : nullptr});
  }
  return EventStream(weak_from_this(), id, std::move(channel));
}

auto EventBus::unsubscribe(std::uint64_t id) -> void {
  std::lock_guard lock(mu_);
  std::erase_if(subscribers_,
                [id](const Subscriber &s) { return s.id == id; });
}

auto EventBus::close() -> void {
  std::vector<Subscriber> subs;
  {
    std::lock_guard lock(mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
    subs.swap(subscribers_);
  }
  for (auto &sub : subs) {
    sub.channel->close();
  }
}

auto EventBus::subscriber_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return subscribers_.size();
}

} // namespace flowcore
