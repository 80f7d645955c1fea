#include "flowcore/executor/target_registry.hpp"

#include "flowcore/store/object_store.hpp"
#include "flowcore/util/log.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace flowcore {
namespace {

constexpr std::int64_t kMaxRangeLength = 10'000'000;

auto first_arg(const StageArgs &args) -> const JsonValue & {
  static const JsonValue kNull{};
  return args.empty() ? kNull : args.front();
}

auto identity(const StageContext &, const StageArgs &args)
    -> Result<JsonValue> {
  if (args.size() == 1) {
    return ok(args.front());
  }
  return ok(JsonValue{JsonArray(args.begin(), args.end())});
}

// range(n) or range({"start", "stop", "step"})
auto range(const StageContext &, const StageArgs &args) -> Result<JsonValue> {
  const auto &arg = first_arg(args);
  std::int64_t start = 0;
  std::int64_t stop = 0;
  std::int64_t step = 1;
  if (auto n = json::as_int(arg)) {
    stop = *n;
  } else if (json::as_object(arg) != nullptr) {
    auto field = [&](std::string_view key) -> std::optional<std::int64_t> {
      const auto *v = json::find_path(arg, key);
      return v ? json::as_int(*v) : std::nullopt;
    };
    auto s = field("stop");
    if (!s) {
      s = field("n");
    }
    if (!s) {
      return fail(Error::InvalidArgument);
    }
    stop = *s;
    start = field("start").value_or(0);
    step = field("step").value_or(1);
  } else {
    return fail(Error::InvalidArgument);
  }
  if (step <= 0 || (stop - start) / step > kMaxRangeLength) {
    return fail(Error::InvalidArgument);
  }

  JsonArray out;
  for (auto i = start; i < stop; i += step) {
    out.emplace_back(i);
  }
  return ok(JsonValue{std::move(out)});
}

// Sums every number in every argument, descending one level into arrays.
auto sum(const StageContext &, const StageArgs &args) -> Result<JsonValue> {
  std::int64_t isum = 0;
  double dsum = 0.0;
  bool integral = true;
  auto add = [&](const JsonValue &v) -> bool {
    if (auto i = v.get_if<std::int64_t>()) {
      isum += *i;
      dsum += static_cast<double>(*i);
      return true;
    }
    if (auto d = json::as_double(v)) {
      integral = false;
      dsum += *d;
      return true;
    }
    return false;
  };
  for (const auto &arg : args) {
    if (const auto *arr = json::as_array(arg)) {
      for (const auto &e : *arr) {
        if (!add(e)) {
          return fail(Error::InvalidArgument);
        }
      }
    } else if (!add(arg)) {
      return fail(Error::InvalidArgument);
    }
  }
  return ok(integral ? JsonValue{isum} : JsonValue{dsum});
}

// x * factor; the factor comes from a second argument, then the run's
// config ("factor"), then the run input ("factor"), else 1.
auto scale(const StageContext &ctx, const StageArgs &args)
    -> Result<JsonValue> {
  const auto &x = first_arg(args);
  const JsonValue *factor = args.size() > 1 ? &args[1] : nullptr;
  if (factor == nullptr && ctx.run) {
    factor = json::find_path(ctx->config, "factor");
    if (factor == nullptr && json::as_object(ctx->input) != nullptr) {
      factor = json::find_path(ctx->input, "factor");
    }
  }
  auto xi = x.get_if<std::int64_t>();
  auto fi = factor ? factor->get_if<std::int64_t>() : nullptr;
  if (xi != nullptr && (factor == nullptr || fi != nullptr)) {
    return ok(JsonValue{*xi * (fi ? *fi : 1)});
  }
  auto xd = json::as_double(x);
  auto fd = factor ? json::as_double(*factor) : std::optional<double>{1.0};
  if (!xd || !fd) {
    return fail(Error::InvalidArgument);
  }
  return ok(JsonValue{*xd * *fd});
}

struct ObjectRef {
  std::string key;
  std::optional<Strategy> strategy;
  std::optional<std::string> ns;
};

auto object_ref(const JsonValue &arg) -> Result<ObjectRef> {
  if (auto key = json::as_string(arg)) {
    return ok(ObjectRef{.key = std::string(*key)});
  }
  const auto *key = json::find_path(arg, "key");
  if (key == nullptr || !json::as_string(*key)) {
    return fail(Error::InvalidArgument);
  }
  ObjectRef ref{.key = std::string(*json::as_string(*key))};
  if (const auto *s = json::find_path(arg, "strategy")) {
    auto parsed =
        util::try_parse_enum<Strategy>(json::as_string(*s).value_or(""));
    if (!parsed) {
      return fail(Error::InvalidArgument);
    }
    ref.strategy = parsed;
  }
  if (const auto *ns = json::find_path(arg, "namespace")) {
    ref.ns = std::string(json::as_string(*ns).value_or(""));
  }
  return ok(std::move(ref));
}

// put_object({"key", "value", "strategy"?, "namespace"?}) -> key
auto put_object(const StageContext &ctx, const StageArgs &args)
    -> Result<JsonValue> {
  if (!ctx.run || ctx->store == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  const auto &arg = first_arg(args);
  auto ref = object_ref(arg);
  if (!ref) {
    return fail(ref.error());
  }
  const auto *value = json::find_path(arg, "value");
  if (value == nullptr) {
    return fail(Error::InvalidArgument);
  }
  auto ns = ref->ns.value_or(ctx->ns);
  if (auto r = ctx->store->put(ref->key, *value, ref->strategy, ns); !r) {
    return fail(r.error());
  }
  return ok(JsonValue{ref->key});
}

// get_object("key") or get_object({"key", "strategy"?, "namespace"?})
auto get_object(const StageContext &ctx, const StageArgs &args)
    -> Result<JsonValue> {
  if (!ctx.run || ctx->store == nullptr) {
    return fail(Error::StorageUnavailable);
  }
  auto ref = object_ref(first_arg(args));
  if (!ref) {
    return fail(ref.error());
  }
  auto ns = ref->ns.value_or(ctx->ns);
  return ctx->store->get(ref->key, ref->strategy, ns);
}

} // namespace

auto register_builtin_targets(TargetRegistry &registry) -> void {
  registry.register_target("flowcore.builtins.identity", identity);
  registry.register_target("flowcore.builtins.range", range);
  registry.register_target("flowcore.builtins.sum", sum);
  registry.register_target("flowcore.builtins.scale", scale);
  registry.register_target("flowcore.builtins.put_object", put_object);
  registry.register_target("flowcore.builtins.get_object", get_object);
}

} // namespace flowcore
