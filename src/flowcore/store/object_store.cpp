#include "flowcore/store/object_store.hpp"

#include "flowcore/store/artifact.hpp"
#include "flowcore/store/cluster_memory.hpp"
#include "flowcore/util/log.hpp"

namespace flowcore {

ClusterMemoryStore::ClusterMemoryStore(
    ClusterMemoryProvider provider,
    std::shared_ptr<const SerializerRegistry> serializers)
    : provider_(std::move(provider)), serializers_(std::move(serializers)) {}

auto ClusterMemoryStore::put(std::string_view key, const JsonValue &value,
                             std::string_view ns) -> Result<void> {
  auto memory = provider_ ? provider_() : nullptr;
  if (memory == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  auto encoded = serializers_->serialize(value);
  if (!encoded) {
    return fail(encoded.error());
  }
  return memory->put(ns, key, std::move(*encoded));
}

auto ClusterMemoryStore::get(std::string_view key, std::string_view ns)
    -> Result<JsonValue> {
  auto memory = provider_ ? provider_() : nullptr;
  if (memory == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  auto stored = memory->get(ns, key);
  if (!stored) {
    return fail(stored.error());
  }
  return serializers_->deserialize(stored->serializer, stored->bytes);
}

auto ClusterMemoryStore::remove(std::string_view key, std::string_view ns)
    -> Result<void> {
  auto memory = provider_ ? provider_() : nullptr;
  if (memory == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  memory->remove(ns, key);
  return ok();
}

auto ClusterMemoryStore::clear(std::string_view ns) -> Result<void> {
  auto memory = provider_ ? provider_() : nullptr;
  if (memory == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  memory->clear(ns);
  return ok();
}

namespace {

auto stale_key(std::string_view key, std::string_view ns) -> std::string {
  std::string out;
  out.reserve(ns.size() + key.size() + 1);
  out.append(ns).push_back('\0');
  out.append(key);
  return out;
}

} // namespace

auto FallbackStore::is_stale(std::string_view key, std::string_view ns) const
    -> bool {
  std::lock_guard lock(stale_mu_);
  return stale_primary_.contains(stale_key(key, ns));
}

auto FallbackStore::set_stale(std::string_view key, std::string_view ns,
                              bool stale) -> void {
  std::lock_guard lock(stale_mu_);
  if (stale) {
    stale_primary_.insert(stale_key(key, ns));
  } else {
    stale_primary_.erase(stale_key(key, ns));
  }
}

auto FallbackStore::put(std::string_view key, const JsonValue &value,
                        std::string_view ns) -> Result<void> {
  auto first = primary_.put(key, value, ns);
  if (first) {
    set_stale(key, ns, false);
    return first;
  }
  log::debug("Object '{}/{}': {} put failed ({}), falling back to {}", ns, key,
             to_string_view(primary_.strategy()), first.error().message(),
             to_string_view(secondary_.strategy()));
  auto second = secondary_.put(key, value, ns);
  if (second) {
    // An older primary copy would shadow the value just written.
    if (auto dropped = primary_.remove(key, ns); !dropped) {
      log::debug("Object '{}/{}': {} copy marked stale ({})", ns, key,
                 to_string_view(primary_.strategy()),
                 dropped.error().message());
      set_stale(key, ns, true);
    } else {
      set_stale(key, ns, false);
    }
  }
  return second;
}

auto FallbackStore::get(std::string_view key, std::string_view ns)
    -> Result<JsonValue> {
  if (is_stale(key, ns)) {
    if (primary_.remove(key, ns)) {
      set_stale(key, ns, false);
    }
    return secondary_.get(key, ns);
  }
  auto first = primary_.get(key, ns);
  if (first) {
    return first;
  }
  log::debug("Object '{}/{}': {} get failed ({}), falling back to {}", ns, key,
             to_string_view(primary_.strategy()), first.error().message(),
             to_string_view(secondary_.strategy()));
  return secondary_.get(key, ns);
}

auto FallbackStore::remove(std::string_view key, std::string_view ns)
    -> Result<void> {
  if (auto r = primary_.remove(key, ns); !r) {
    log::debug("Object '{}/{}': {} remove failed ({})", ns, key,
               to_string_view(primary_.strategy()), r.error().message());
    set_stale(key, ns, true);
  } else {
    set_stale(key, ns, false);
  }
  return secondary_.remove(key, ns);
}

ObjectStore::ObjectStore(const ComputeConfig &compute,
                         const StorageConfig &storage,
                         ClusterMemoryProvider provider)
    : default_strategy_(compute.default_os_strategy),
      default_namespace_(compute.default_namespace),
      serializers_(std::make_shared<const SerializerRegistry>()),
      cluster_(std::make_unique<ClusterMemoryStore>(std::move(provider),
                                                    serializers_)),
      artifact_(
          std::make_unique<ArtifactStore>(storage.artifact_dir, serializers_)),
      fallback_(std::make_unique<FallbackStore>(*cluster_, *artifact_)) {}

ObjectStore::~ObjectStore() = default;

auto ObjectStore::tier(Strategy strategy) -> IObjectStore & {
  switch (strategy) {
  case Strategy::ClusterMemory:
    return *cluster_;
  case Strategy::Artifact:
    return *artifact_;
  case Strategy::Fallback:
    break;
  }
  return *fallback_;
}

auto ObjectStore::put(std::string_view key, const JsonValue &value,
                      std::optional<Strategy> strategy,
                      std::optional<std::string_view> ns) -> Result<void> {
  auto &store = tier(strategy.value_or(default_strategy_));
  auto r = store.put(key, value, ns.value_or(default_namespace_));
  if (!r) {
    log::warn("Object store put '{}' via {} failed: {}", key,
              to_string_view(store.strategy()), r.error().message());
  }
  return r;
}

auto ObjectStore::get(std::string_view key, std::optional<Strategy> strategy,
                      std::optional<std::string_view> ns)
    -> Result<JsonValue> {
  return tier(strategy.value_or(default_strategy_))
      .get(key, ns.value_or(default_namespace_));
}

auto ObjectStore::remove(std::string_view key,
                         std::optional<Strategy> strategy,
                         std::optional<std::string_view> ns) -> Result<void> {
  return tier(strategy.value_or(default_strategy_))
      .remove(key, ns.value_or(default_namespace_));
}

} // namespace flowcore
