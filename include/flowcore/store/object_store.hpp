#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"
#include "flowcore/store/serializer.hpp"
#include "flowcore/store/strategy.hpp"
#include "flowcore/util/hash.hpp"
#include "flowcore/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace flowcore {

class ClusterMemory;
class ArtifactStore;

// One storage tier. Values are serialized on put, so the store never shares
// state with the caller's copy.
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  [[nodiscard]] virtual auto put(std::string_view key, const JsonValue &value,
                                 std::string_view ns) -> Result<void> = 0;
  [[nodiscard]] virtual auto get(std::string_view key, std::string_view ns)
      -> Result<JsonValue> = 0;
  // Idempotent: removing an absent key succeeds.
  [[nodiscard]] virtual auto remove(std::string_view key, std::string_view ns)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto strategy() const noexcept -> Strategy = 0;
};

// Looks up the executor session's shared memory on every call; a session
// that is absent or disconnected reports StorageUnavailable.
using ClusterMemoryProvider = std::function<std::shared_ptr<ClusterMemory>()>;

class ClusterMemoryStore final : public IObjectStore {
public:
  ClusterMemoryStore(ClusterMemoryProvider provider,
                     std::shared_ptr<const SerializerRegistry> serializers);

  [[nodiscard]] auto put(std::string_view key, const JsonValue &value,
                         std::string_view ns) -> Result<void> override;
  [[nodiscard]] auto get(std::string_view key, std::string_view ns)
      -> Result<JsonValue> override;
  [[nodiscard]] auto remove(std::string_view key, std::string_view ns)
      -> Result<void> override;
  [[nodiscard]] auto strategy() const noexcept -> Strategy override {
    return Strategy::ClusterMemory;
  }

  // Drops every key of a namespace, exclusive against concurrent access.
  [[nodiscard]] auto clear(std::string_view ns) -> Result<void>;

private:
  ClusterMemoryProvider provider_;
  std::shared_ptr<const SerializerRegistry> serializers_;
};

// Tries `primary` first and retries on `secondary` after any primary
// failure. The primary error is logged, never returned. A key written to
// `secondary` while its primary copy could not be dropped is marked stale
// on the primary, and reads skip that copy until a primary write or remove
// clears the mark.
class FallbackStore final : public IObjectStore {
public:
  FallbackStore(IObjectStore &primary, IObjectStore &secondary)
      : primary_(primary), secondary_(secondary) {}

  [[nodiscard]] auto put(std::string_view key, const JsonValue &value,
                         std::string_view ns) -> Result<void> override;
  [[nodiscard]] auto get(std::string_view key, std::string_view ns)
      -> Result<JsonValue> override;
  [[nodiscard]] auto remove(std::string_view key, std::string_view ns)
      -> Result<void> override;
  [[nodiscard]] auto strategy() const noexcept -> Strategy override {
    return Strategy::Fallback;
  }

private:
  [[nodiscard]] auto is_stale(std::string_view key, std::string_view ns) const
      -> bool;
  auto set_stale(std::string_view key, std::string_view ns, bool stale)
      -> void;

  IObjectStore &primary_;
  IObjectStore &secondary_;
  mutable std::mutex stale_mu_;
  ankerl::unordered_dense::set<std::string, StringHash, std::equal_to<>>
      stale_primary_;
};

// Entry point used by stages: picks a tier per call, defaulting strategy and
// namespace from the compute configuration.
class ObjectStore {
public:
  ObjectStore(const ComputeConfig &compute, const StorageConfig &storage,
              ClusterMemoryProvider provider);
  ~ObjectStore();

  ObjectStore(const ObjectStore &) = delete;
  ObjectStore &operator=(const ObjectStore &) = delete;

  [[nodiscard]] auto put(std::string_view key, const JsonValue &value,
                         std::optional<Strategy> strategy = std::nullopt,
                         std::optional<std::string_view> ns = std::nullopt)
      -> Result<void>;
  [[nodiscard]] auto get(std::string_view key,
                         std::optional<Strategy> strategy = std::nullopt,
                         std::optional<std::string_view> ns = std::nullopt)
      -> Result<JsonValue>;
  [[nodiscard]] auto remove(std::string_view key,
                            std::optional<Strategy> strategy = std::nullopt,
                            std::optional<std::string_view> ns = std::nullopt)
      -> Result<void>;

  [[nodiscard]] auto tier(Strategy strategy) -> IObjectStore &;
  [[nodiscard]] auto artifacts() noexcept -> ArtifactStore & {
    return *artifact_;
  }
  [[nodiscard]] auto cluster_memory() noexcept -> ClusterMemoryStore & {
    return *cluster_;
  }
  [[nodiscard]] auto default_strategy() const noexcept -> Strategy {
    return default_strategy_;
  }
  [[nodiscard]] auto default_namespace() const noexcept -> std::string_view {
    return default_namespace_;
  }

private:
  Strategy default_strategy_;
  std::string default_namespace_;
  std::shared_ptr<const SerializerRegistry> serializers_;
  std::unique_ptr<ClusterMemoryStore> cluster_;
  std::unique_ptr<ArtifactStore> artifact_;
  std::unique_ptr<FallbackStore> fallback_;
};

} // namespace flowcore
