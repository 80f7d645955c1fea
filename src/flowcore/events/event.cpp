#include "flowcore/events/event.hpp"

namespace flowcore {

auto make_event(std::string_view channel, std::string_view source,
                std::string_view type, JsonValue data) -> Event {
  Event event;
  event.id = generate_event_id();
  event.time = std::chrono::system_clock::now();
  event.channel = std::string(channel);
  event.source = std::string(source);
  event.type = std::string(type);
  event.data = std::move(data);
  return event;
}

auto to_json(const Event &event) -> JsonValue {
  auto headers = make_object();
  for (const auto &[k, v] : event.headers) {
    headers.get_object()[k] = v;
  }
  JsonValue out{{"id", event.id.str()},
                {"time", util::format_iso8601(event.time)},
                {"headers", std::move(headers)},
                {"correlation_id", event.correlation_id},
                {"reply_channel", event.reply_channel},
                {"channel", event.channel},
                {"source", event.source},
                {"type", event.type},
                {"data", event.data}};
  return out;
}

} // namespace flowcore
