#include "flowcore/events/event_bus.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace flowcore;
using namespace std::chrono_literals;

namespace {

auto event(std::string_view channel, std::string_view type) -> Event {
  return make_event(channel, "test", type, make_object());
}

auto drain(EventStream &stream) -> std::vector<std::string> {
  std::vector<std::string> types;
  while (auto e = stream.try_next()) {
    types.push_back(e->type);
  }
  return types;
}

} // namespace

class EventBusTest : public ::testing::Test {
protected:
  boost::asio::io_context io_;
  std::shared_ptr<EventBus> bus_ = EventBus::create();
};

TEST_F(EventBusTest, EverySubscriberSeesMatchingEvents) {
  auto all = bus_->subscribe(io_.get_executor());
  auto orders = bus_->subscribe(io_.get_executor(), [](const Event &e) {
    return e.channel == "orders";
  });
  EXPECT_EQ(bus_->subscriber_count(), 2u);

  bus_->publish(event("orders", "created"));
  bus_->publish(event("billing", "charged"));
  bus_->publish(event("orders", "shipped"));

  EXPECT_EQ(drain(all),
            (std::vector<std::string>{"created", "charged", "shipped"}));
  EXPECT_EQ(drain(orders), (std::vector<std::string>{"created", "shipped"}));
}

TEST_F(EventBusTest, MadeEventsCarryIdentity) {
  auto a = make_event("c", "src", "t", parse_json(R"({"x": 1})").value());
  auto b = make_event("c", "src", "t", make_object());
  EXPECT_FALSE(a.id.empty());
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(a.source, "src");

  auto doc = to_json(a);
  EXPECT_EQ(json::as_int(*json::find_path(doc, "data.x")), 1);
  EXPECT_EQ(json::as_string(*json::find_path(doc, "type")), "t");
  EXPECT_EQ(json::as_string(*json::find_path(doc, "id")), a.id.str());
}

TEST_F(EventBusTest, PublishNeverBlocksOnAFullSubscriber) {
  auto slow = bus_->subscribe(io_.get_executor(), {}, 2);
  auto roomy = bus_->subscribe(io_.get_executor());

  for (int i = 0; i < 5; ++i) {
    bus_->publish(event("c", std::to_string(i)));
  }
  EXPECT_EQ(bus_->dropped(), 3u);
  EXPECT_EQ(drain(slow), (std::vector<std::string>{"0", "1"}));
  EXPECT_EQ(drain(roomy).size(), 5u);
}

TEST_F(EventBusTest, ReliableSubscriberBacklogsInsteadOfDropping) {
  auto stream = bus_->subscribe(io_.get_executor(), {}, 2, Delivery::Reliable);
  for (int i = 0; i < 10; ++i) {
    bus_->publish(event("c", std::to_string(i)));
  }
  EXPECT_EQ(bus_->dropped(), 0u);

  std::vector<std::string> types;
  co_spawn(
      io_,
      [&]() -> spawn_task {
        for (int i = 0; i < 10; ++i) {
          auto e = co_await stream.next();
          if (!e) {
            co_return;
          }
          types.push_back(e->type);
        }
      },
      detached);
  io_.run_for(2s);

  EXPECT_EQ(types, (std::vector<std::string>{"0", "1", "2", "3", "4", "5",
                                             "6", "7", "8", "9"}));
}

TEST_F(EventBusTest, ClosingAStreamUnsubscribes) {
  auto stream = bus_->subscribe(io_.get_executor());
  {
    auto scoped = bus_->subscribe(io_.get_executor());
    EXPECT_EQ(bus_->subscriber_count(), 2u);
  }
  EXPECT_EQ(bus_->subscriber_count(), 1u);

  stream.close();
  EXPECT_EQ(bus_->subscriber_count(), 0u);
  bus_->publish(event("c", "lost"));
  EXPECT_FALSE(stream.try_next().has_value());
  EXPECT_EQ(bus_->dropped(), 0u);
}

TEST_F(EventBusTest, NextWaitsForThePublisher) {
  auto stream = bus_->subscribe(io_.get_executor());
  std::optional<Result<Event>> received;
  co_spawn(
      io_,
      [&]() -> spawn_task { received = co_await stream.next(); },
      detached);

  std::jthread publisher([this] {
    std::this_thread::sleep_for(20ms);
    bus_->publish(event("c", "late"));
  });
  io_.run_for(2s);

  ASSERT_TRUE(received.has_value());
  ASSERT_TRUE(received->has_value());
  EXPECT_EQ((*received)->type, "late");
}

TEST_F(EventBusTest, ClosingTheBusEndsPendingReads) {
  auto stream = bus_->subscribe(io_.get_executor());
  std::optional<Result<Event>> received;
  co_spawn(
      io_,
      [&]() -> spawn_task { received = co_await stream.next(); },
      detached);
  io_.poll();
  EXPECT_FALSE(received.has_value());

  bus_->close();
  io_.run_for(1s);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->error(), make_error_code(Error::Cancelled));

  // Subscribing after close yields a stream that is already finished.
  auto late = bus_->subscribe(io_.get_executor());
  EXPECT_EQ(bus_->subscriber_count(), 0u);
  EXPECT_EQ(test::run_coro(late.next()).error(),
            make_error_code(Error::Cancelled));
}

TEST_F(EventBusTest, StreamOutlivingTheBusIsHarmless) {
  auto stream = bus_->subscribe(io_.get_executor());
  bus_.reset();
  EXPECT_FALSE(stream.try_next().has_value());
  stream.close();
  stream.close();
}
