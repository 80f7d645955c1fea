#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/util/json.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

class ISerializer {
public:
  virtual ~ISerializer() = default;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
  [[nodiscard]] virtual auto serialize(const JsonValue &value) const
      -> Result<std::string> = 0;
  [[nodiscard]] virtual auto deserialize(std::string_view bytes) const
      -> Result<JsonValue> = 0;
};

// JSON text encoding. NaN and infinities have no JSON form and are rejected.
class JsonSerializer final : public ISerializer {
public:
  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "json";
  }
  [[nodiscard]] auto serialize(const JsonValue &value) const
      -> Result<std::string> override;
  [[nodiscard]] auto deserialize(std::string_view bytes) const
      -> Result<JsonValue> override;
};

struct SerializedValue {
  std::string serializer;
  std::string bytes;
};

// Ordered set of serializers; the first one that accepts a value wins.
class SerializerRegistry {
public:
  SerializerRegistry();

  auto add(std::shared_ptr<const ISerializer> serializer) -> void;

  [[nodiscard]] auto serialize(const JsonValue &value) const
      -> Result<SerializedValue>;
  [[nodiscard]] auto deserialize(std::string_view serializer,
                                 std::string_view bytes) const
      -> Result<JsonValue>;

private:
  std::vector<std::shared_ptr<const ISerializer>> serializers_;
};

} // namespace flowcore
