#pragma once

#include <boost/asio/io_context.hpp>

namespace flowcore {

using shard_id = unsigned;

namespace io {
using IoContext = boost::asio::io_context;
} // namespace io

// One event loop driven by exactly one runtime thread. State owned by a
// shard is only touched from that thread, so it needs no locking.
class Shard {
public:
  explicit Shard(shard_id id) : id_(id), ctx_(1) {}

  Shard(const Shard &) = delete;
  Shard &operator=(const Shard &) = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id { return id_; }
  [[nodiscard]] auto ctx() noexcept -> io::IoContext & { return ctx_; }

private:
  shard_id id_;
  io::IoContext ctx_;
};

} // namespace flowcore
