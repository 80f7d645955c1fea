#include "flowcore/store/cluster_memory.hpp"
#include "flowcore/store/object_store.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace flowcore;

namespace {

auto value(std::string bytes) -> SerializedValue {
  return SerializedValue{.serializer = "json", .bytes = std::move(bytes)};
}

} // namespace

TEST(ClusterMemoryTest, PutGetRemove) {
  ClusterMemory memory;
  ASSERT_TRUE(memory.put("default", "answer", value("42")));
  auto got = memory.get("default", "answer");
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->bytes, "42");
  EXPECT_EQ(got->serializer, "json");
  EXPECT_TRUE(memory.contains("default", "answer"));

  memory.remove("default", "answer");
  EXPECT_FALSE(memory.contains("default", "answer"));
  EXPECT_EQ(memory.get("default", "answer").error(),
            make_error_code(Error::NotFound));
  // Removing twice is fine.
  memory.remove("default", "answer");
}

TEST(ClusterMemoryTest, NamespacesAreIsolated) {
  ClusterMemory memory;
  ASSERT_TRUE(memory.put("a", "k", value("1")));
  ASSERT_TRUE(memory.put("b", "k", value("2")));
  EXPECT_EQ(memory.get("a", "k")->bytes, "1");
  EXPECT_EQ(memory.get("b", "k")->bytes, "2");

  memory.clear("a");
  EXPECT_FALSE(memory.contains("a", "k"));
  EXPECT_TRUE(memory.contains("b", "k"));
  EXPECT_EQ(memory.get("nowhere", "k").error(),
            make_error_code(Error::NotFound));
}

TEST(ClusterMemoryTest, OverwriteReplacesValue) {
  ClusterMemory memory;
  ASSERT_TRUE(memory.put("ns", "k", value("1")));
  ASSERT_TRUE(memory.put("ns", "k", value("2")));
  EXPECT_EQ(memory.get("ns", "k")->bytes, "2");
  EXPECT_EQ(memory.keys("ns").size(), 1);
}

TEST(ClusterMemoryTest, EntrySizeLimit) {
  ClusterMemory memory(4);
  EXPECT_TRUE(memory.put("ns", "small", value("1234")));
  auto big = memory.put("ns", "big", value("12345"));
  ASSERT_FALSE(big.has_value());
  EXPECT_EQ(big.error(), make_error_code(Error::ResourceExhausted));
  EXPECT_FALSE(memory.contains("ns", "big"));
}

TEST(ClusterMemoryTest, KeysAndClearAll) {
  ClusterMemory memory;
  ASSERT_TRUE(memory.put("x", "one", value("1")));
  ASSERT_TRUE(memory.put("x", "two", value("2")));
  ASSERT_TRUE(memory.put("y", "three", value("3")));

  auto keys = memory.keys("x");
  std::ranges::sort(keys);
  EXPECT_EQ(keys, (std::vector<std::string>{"one", "two"}));
  EXPECT_TRUE(memory.keys("missing").empty());

  memory.clear_all();
  EXPECT_TRUE(memory.keys("x").empty());
  EXPECT_TRUE(memory.keys("y").empty());
}

TEST(ClusterMemoryTest, ConcurrentWritersOnDistinctKeys) {
  ClusterMemory memory;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&memory, t] {
        for (int i = 0; i < kPerThread; ++i) {
          auto key = std::format("k{}_{}", t, i);
          EXPECT_TRUE(memory.put("shared", key, value(std::to_string(i))));
          EXPECT_TRUE(memory.get("shared", key).has_value());
        }
      });
    }
  }
  EXPECT_EQ(memory.keys("shared").size(),
            static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(ClusterMemoryTest, ClearIsAtomicAgainstWriters) {
  ClusterMemory memory;
  std::atomic<bool> stop{false};
  std::jthread writer([&] {
    int i = 0;
    while (!stop.load()) {
      (void)memory.put("busy", std::format("k{}", i++ % 50), value("x"));
    }
  });
  for (int round = 0; round < 50; ++round) {
    memory.clear("busy");
  }
  stop.store(true);
  writer.join();
  memory.clear("busy");
  EXPECT_TRUE(memory.keys("busy").empty());
}

TEST(ClusterMemoryStoreTest, RoundTripThroughSerializer) {
  auto memory = std::make_shared<ClusterMemory>();
  ClusterMemoryStore store([memory] { return memory; },
                           std::make_shared<const SerializerRegistry>());
  auto doc = parse_json(R"({"rows": 3, "names": ["a", "b"]})").value();
  ASSERT_TRUE(store.put("doc", doc, "default"));

  auto got = store.get("doc", "default");
  ASSERT_TRUE(got.has_value());
  EXPECT_TRUE(json::equal(*got, doc));
  EXPECT_EQ(store.strategy(), Strategy::ClusterMemory);

  ASSERT_TRUE(store.remove("doc", "default"));
  EXPECT_EQ(store.get("doc", "default").error(),
            make_error_code(Error::NotFound));
}

TEST(ClusterMemoryStoreTest, NoSessionMeansUnavailable) {
  ClusterMemoryStore store(
      []() -> std::shared_ptr<ClusterMemory> { return nullptr; },
      std::make_shared<const SerializerRegistry>());
  auto unavailable = make_error_code(Error::StorageUnavailable);
  EXPECT_EQ(store.put("k", JsonValue{std::int64_t{1}}, "ns").error(), unavailable);
  EXPECT_EQ(store.get("k", "ns").error(), unavailable);
  EXPECT_EQ(store.remove("k", "ns").error(), unavailable);
  EXPECT_EQ(store.clear("ns").error(), unavailable);
}

TEST(ClusterMemoryStoreTest, NonFiniteValueIsRejected) {
  auto memory = std::make_shared<ClusterMemory>();
  ClusterMemoryStore store([memory] { return memory; },
                           std::make_shared<const SerializerRegistry>());
  auto r = store.put("nan", JsonValue{std::nan("")}, "ns");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::SerializationFailed));
}
