#include "flowcore/definitions/definition_watcher.hpp"

#include "flowcore/core/coroutine.hpp"
#include "flowcore/core/runtime.hpp"
#include "flowcore/util/log.hpp"

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>

#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <future>

namespace flowcore {
namespace {
constexpr std::size_t kEventBufferSize = 16 * 1024;
} // namespace

struct DefinitionWatcher::WatchState {
  std::filesystem::path directory;
  std::atomic<bool> running{false};
  FileChangeCallback on_file_changed;
  FileRemoveCallback on_file_removed;
  std::unique_ptr<boost::asio::posix::stream_descriptor> stream;
};

DefinitionWatcher::DefinitionWatcher(Runtime &runtime,
                                     std::filesystem::path directory,
                                     shard_id shard)
    : runtime_(&runtime), directory_(std::move(directory)), shard_(shard) {}

DefinitionWatcher::~DefinitionWatcher() { stop(); }

auto DefinitionWatcher::set_on_file_changed(FileChangeCallback cb) -> void {
  on_file_changed_ = std::move(cb);
}

auto DefinitionWatcher::set_on_file_removed(FileRemoveCallback cb) -> void {
  on_file_removed_ = std::move(cb);
}

auto DefinitionWatcher::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  auto fd = sys_check(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd) {
    log::error("Failed to initialize inotify: {}", fd.error().message());
    running_.store(false);
    return fail(fd.error());
  }

  auto wd = sys_check(inotify_add_watch(
      *fd, directory_.c_str(),
      IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO));
  if (!wd) {
    log::error("Failed to watch {}: {}", directory_.string(),
               wd.error().message());
    ::close(*fd);
    running_.store(false);
    return fail(wd.error());
  }

  auto state = std::make_shared<WatchState>();
  state->directory = directory_;
  state->on_file_changed = std::move(on_file_changed_);
  state->on_file_removed = std::move(on_file_removed_);
  state->stream = std::make_unique<boost::asio::posix::stream_descriptor>(
      runtime_->shard(shard_).ctx(), *fd);
  state->running.store(true, std::memory_order_release);
  state_ = state;

  co_spawn(
      runtime_->executor_for(shard_),
      [state]() -> spawn_task {
        std::array<char, kEventBufferSize> buffer{};
        while (state->running.load(std::memory_order_acquire) &&
               state->stream) {
          auto [ec, n] = co_await state->stream->async_read_some(
              boost::asio::buffer(buffer), use_nothrow);
          if (ec == boost::asio::error::operation_aborted) {
            break;
          }
          if (ec) {
            if (ec != boost::asio::error::bad_descriptor) {
              log::warn("Definition watcher read failed: {}", ec.message());
            }
            break;
          }
          if (n > 0) {
            process_events(*state, buffer.data(), static_cast<ssize_t>(n));
          }
        }
      },
      detached);

  log::info("Watching definitions in {}", directory_.string());
  return ok();
}

auto DefinitionWatcher::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  auto state = std::move(state_);
  if (!state) {
    return;
  }
  state->running.store(false, std::memory_order_release);

  // The stream belongs to the watcher shard; close it there.
  auto shutdown = [state] {
    if (state->stream) {
      boost::system::error_code ec;
      state->stream->cancel(ec);
      state->stream->close(ec);
      state->stream.reset();
    }
  };

  if (!runtime_->is_running() ||
      (runtime_->is_current_shard() && runtime_->current_shard() == shard_)) {
    shutdown();
    return;
  }

  std::promise<void> done;
  auto done_fut = done.get_future();
  runtime_->post_to(shard_, [shutdown = std::move(shutdown),
                             done = std::move(done)]() mutable {
    shutdown();
    done.set_value();
  });
  done_fut.wait();
}

auto DefinitionWatcher::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto DefinitionWatcher::is_ignored(std::string_view name) -> bool {
  if (name.empty() || name.starts_with('.') || name.ends_with('~')) {
    return true;
  }
  constexpr std::array<std::string_view, 7> kTransientSuffixes{
      ".swp", ".swo", ".swx", ".tmp", ".temp", ".bak", ".part"};
  return std::ranges::any_of(kTransientSuffixes, [name](std::string_view s) {
    return name.ends_with(s);
  });
}

auto DefinitionWatcher::process_events(WatchState &state, const char *buf,
                                       ssize_t len) -> void {
  ssize_t i = 0;
  while (i < len) {
    const auto *event = reinterpret_cast<const inotify_event *>(buf + i);
    i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

    if (event->len == 0) {
      continue;
    }
    std::string_view name{event->name};
    if (is_ignored(name) || !name.ends_with(".json")) {
      continue;
    }

    auto path = state.directory / name;
    if ((event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) != 0U) {
      log::info("Definition file changed: {}", path.string());
      if (state.on_file_changed) {
        state.on_file_changed(path);
      }
    } else if ((event->mask & (IN_DELETE | IN_MOVED_FROM)) != 0U) {
      log::info("Definition file removed: {}", path.string());
      if (state.on_file_removed) {
        state.on_file_removed(path);
      }
    }
  }
}

} // namespace flowcore
