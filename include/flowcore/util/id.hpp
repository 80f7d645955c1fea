#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace flowcore {

struct RunTag {};
struct EventTag {};

// Phantom-typed string id; a RunId cannot be passed where an EventId is
// expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }
  [[nodiscard]] auto clone() const -> TypedId { return TypedId{value_}; }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using RunId = TypedId<RunTag>;
using EventId = TypedId<EventTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_short_uuid() -> std::string;
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto generate_event_id() -> EventId {
  return EventId{detail::generate_uuid_v7_like()};
}

} // namespace flowcore

// `is_avalanching` lets ankerl::unordered_dense delegate to this hash instead
// of hashing the raw object bytes.
template <typename Tag> struct std::hash<flowcore::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const flowcore::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<flowcore::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const flowcore::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
