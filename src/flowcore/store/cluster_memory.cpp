#include "flowcore/store/cluster_memory.hpp"

#include <ranges>

namespace flowcore {

auto ClusterMemory::find_namespace(std::string_view ns) const
    -> std::shared_ptr<Namespace> {
  std::lock_guard lock(ns_mu_);
  auto it = namespaces_.find(ns);
  return it != namespaces_.end() ? it->second : nullptr;
}

auto ClusterMemory::get_or_create_namespace(std::string_view ns)
    -> std::shared_ptr<Namespace> {
  std::lock_guard lock(ns_mu_);
  auto it = namespaces_.find(ns);
  if (it != namespaces_.end()) {
    return it->second;
  }
  auto created = std::make_shared<Namespace>();
  namespaces_.emplace(std::string(ns), created);
  return created;
}

auto ClusterMemory::put(std::string_view ns, std::string_view key,
                        SerializedValue value) -> Result<void> {
  if (max_entry_bytes_ != 0 && value.bytes.size() > max_entry_bytes_) {
    return fail(Error::ResourceExhausted);
  }
  auto space = get_or_create_namespace(ns);
  std::shared_lock gate(space->gate);

  // A concurrent remove may retire the slot between lookup and write; retry
  // against the fresh slot so the put is never lost.
  while (true) {
    std::shared_ptr<Slot> slot;
    {
      std::lock_guard lock(space->map_mu);
      auto &entry = space->slots[std::string(key)];
      if (!entry) {
        entry = std::make_shared<Slot>();
      }
      slot = entry;
    }
    std::lock_guard slot_lock(slot->mu);
    if (!slot->live) {
      continue;
    }
    slot->value = std::move(value);
    return ok();
  }
}

auto ClusterMemory::get(std::string_view ns, std::string_view key) const
    -> Result<SerializedValue> {
  auto space = find_namespace(ns);
  if (!space) {
    return fail(Error::NotFound);
  }
  std::shared_lock gate(space->gate);
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(space->map_mu);
    auto it = space->slots.find(key);
    if (it == space->slots.end()) {
      return fail(Error::NotFound);
    }
    slot = it->second;
  }
  std::lock_guard slot_lock(slot->mu);
  if (!slot->live) {
    return fail(Error::NotFound);
  }
  return ok(slot->value);
}

auto ClusterMemory::remove(std::string_view ns, std::string_view key)
    -> void {
  auto space = find_namespace(ns);
  if (!space) {
    return;
  }
  std::shared_lock gate(space->gate);
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(space->map_mu);
    auto it = space->slots.find(key);
    if (it == space->slots.end()) {
      return;
    }
    slot = it->second;
    space->slots.erase(it);
  }
  std::lock_guard slot_lock(slot->mu);
  slot->live = false;
}

auto ClusterMemory::clear(std::string_view ns) -> void {
  auto space = find_namespace(ns);
  if (!space) {
    return;
  }
  std::unique_lock gate(space->gate);
  std::lock_guard lock(space->map_mu);
  for (auto &[_, slot] : space->slots) {
    std::lock_guard slot_lock(slot->mu);
    slot->live = false;
  }
  space->slots.clear();
}

auto ClusterMemory::clear_all() -> void {
  std::vector<std::string> names;
  {
    std::lock_guard lock(ns_mu_);
    names = namespaces_ | std::views::keys | std::ranges::to<std::vector>();
  }
  for (const auto &name : names) {
    clear(name);
  }
}

auto ClusterMemory::contains(std::string_view ns, std::string_view key) const
    -> bool {
  return get(ns, key).has_value();
}

auto ClusterMemory::keys(std::string_view ns) const
    -> std::vector<std::string> {
  auto space = find_namespace(ns);
  if (!space) {
    return {};
  }
  std::shared_lock gate(space->gate);
  std::lock_guard lock(space->map_mu);
  return space->slots | std::views::keys | std::ranges::to<std::vector>();
}

} // namespace flowcore
