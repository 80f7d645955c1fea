#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/store/serializer.hpp"
#include "flowcore/util/hash.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

// Keyed memory shared by every worker of one executor session.
//
// Locking: each namespace has a gate taken shared by put/get/remove and
// exclusively by clear(), so a clear is linearized against every operation
// in that namespace. Within the gate the key map lock is held only for
// lookup; the value itself is guarded by a per-key slot lock, so operations
// on different keys never wait on each other's copies.
class ClusterMemory {
public:
  explicit ClusterMemory(std::uint64_t max_entry_bytes = 0)
      : max_entry_bytes_(max_entry_bytes) {}

  ClusterMemory(const ClusterMemory &) = delete;
  ClusterMemory &operator=(const ClusterMemory &) = delete;

  [[nodiscard]] auto put(std::string_view ns, std::string_view key,
                         SerializedValue value) -> Result<void>;
  [[nodiscard]] auto get(std::string_view ns, std::string_view key) const
      -> Result<SerializedValue>;
  // Absent keys are not an error.
  auto remove(std::string_view ns, std::string_view key) -> void;
  auto clear(std::string_view ns) -> void;
  auto clear_all() -> void;

  [[nodiscard]] auto contains(std::string_view ns, std::string_view key) const
      -> bool;
  [[nodiscard]] auto keys(std::string_view ns) const
      -> std::vector<std::string>;

private:
  struct Slot {
    std::mutex mu;
    SerializedValue value;
    bool live{true};
  };

  struct Namespace {
    std::shared_mutex gate;
    std::mutex map_mu;
    ankerl::unordered_dense::map<std::string, std::shared_ptr<Slot>,
                                 StringHash, std::equal_to<>>
        slots;
  };

  [[nodiscard]] auto find_namespace(std::string_view ns) const
      -> std::shared_ptr<Namespace>;
  [[nodiscard]] auto get_or_create_namespace(std::string_view ns)
      -> std::shared_ptr<Namespace>;

  std::uint64_t max_entry_bytes_;
  mutable std::mutex ns_mu_;
  ankerl::unordered_dense::map<std::string, std::shared_ptr<Namespace>,
                               StringHash, std::equal_to<>>
      namespaces_;
};

} // namespace flowcore
