#include "flowcore/store/serializer.hpp"

#include "flowcore/util/log.hpp"

namespace flowcore {

auto JsonSerializer::serialize(const JsonValue &value) const
    -> Result<std::string> {
  if (!json::all_finite(value)) {
    return fail(Error::SerializationFailed);
  }
  auto out = glz::write_json(value);
  if (!out) {
    return fail(Error::SerializationFailed);
  }
  return ok(std::move(*out));
}

auto JsonSerializer::deserialize(std::string_view bytes) const
    -> Result<JsonValue> {
  auto value = parse_json(bytes);
  if (!value) {
    return fail(Error::SerializationFailed);
  }
  return value;
}

SerializerRegistry::SerializerRegistry() {
  serializers_.push_back(std::make_shared<const JsonSerializer>());
}

auto SerializerRegistry::add(std::shared_ptr<const ISerializer> serializer)
    -> void {
  serializers_.push_back(std::move(serializer));
}

auto SerializerRegistry::serialize(const JsonValue &value) const
    -> Result<SerializedValue> {
  for (const auto &s : serializers_) {
    if (auto bytes = s->serialize(value)) {
      return ok(SerializedValue{.serializer = std::string(s->name()),
                                .bytes = std::move(*bytes)});
    }
  }
  log::debug("No serializer accepted value");
  return fail(Error::SerializationFailed);
}

auto SerializerRegistry::deserialize(std::string_view serializer,
                                     std::string_view bytes) const
    -> Result<JsonValue> {
  for (const auto &s : serializers_) {
    if (s->name() == serializer) {
      return s->deserialize(bytes);
    }
  }
  return fail(Error::SerializationFailed);
}

} // namespace flowcore
