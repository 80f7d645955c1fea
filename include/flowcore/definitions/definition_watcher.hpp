#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/core/shard.hpp"

#include <sys/types.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace flowcore {

class Runtime;

using FileChangeCallback =
    std::move_only_function<void(const std::filesystem::path &)>;
using FileRemoveCallback =
    std::move_only_function<void(const std::filesystem::path &)>;

// Watches a definition directory with inotify and reports *.json files that
// were written or moved in, and those deleted or moved out. Callbacks run on the
// watcher's shard.
class DefinitionWatcher {
public:
  DefinitionWatcher(Runtime &runtime, std::filesystem::path directory,
                    shard_id shard = 0);
  ~DefinitionWatcher();

  DefinitionWatcher(const DefinitionWatcher &) = delete;
  auto operator=(const DefinitionWatcher &) -> DefinitionWatcher & = delete;

  // Callbacks must be set before start().
  auto set_on_file_changed(FileChangeCallback cb) -> void;
  auto set_on_file_removed(FileRemoveCallback cb) -> void;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto directory() const -> const std::filesystem::path & {
    return directory_;
  }

  // Editor swap files, temporaries and hidden files are ignored.
  [[nodiscard]] static auto is_ignored(std::string_view file_name) -> bool;

private:
  struct WatchState;
  static auto process_events(WatchState &state, const char *buf, ssize_t len)
      -> void;

  Runtime *runtime_;
  std::filesystem::path directory_;
  shard_id shard_;
  std::atomic<bool> running_{false};
  std::shared_ptr<WatchState> state_;

  FileChangeCallback on_file_changed_;
  FileRemoveCallback on_file_removed_;
};

} // namespace flowcore
