#include "flowcore/definitions/definition_loader.hpp"

#include "flowcore/config/toml_util.hpp"
#include "flowcore/util/log.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <optional>

namespace flowcore {
namespace detail {

struct MetadataJson {
  std::string name;
  std::map<std::string, std::string> annotations;
};

struct DocumentJson {
  std::string kind;
  MetadataJson metadata;
  glz::raw_json spec{};
};

struct StageOptionsJson {
  std::optional<std::string> map_on;
};

struct StageResourcesJson {
  double cpus{0.0};
  double gpus{0.0};
  std::int64_t memory{0};
  std::map<std::string, std::string> labels;
};

struct StageJson {
  std::string name;
  std::string target;
  std::string type{"simple"};
  std::vector<std::string> depends_on;
  std::string description;
  int priority{0};
  StageOptionsJson options;
  StageResourcesJson resources;
  bool collect{false};
};

struct WorkflowSpecJson {
  std::string description;
  std::vector<StageJson> stages;
};

struct ActionJson {
  std::string target{kRunWorkflowAction};
  std::optional<JsonValue> parameters;
  std::optional<JsonValue> params;
};

struct TriggerSpecJson {
  std::string type{"condition"};
  JsonValue rule;
  ActionJson action;
};

struct ConfigSpecJson {
  std::vector<std::string> workflows;
  std::map<std::string, std::string> match_annotations;
  JsonValue data;
};

} // namespace detail
} // namespace flowcore

namespace glz {
template <> struct meta<flowcore::detail::MetadataJson> {
  using T = flowcore::detail::MetadataJson;
  static constexpr auto value =
      object("name", &T::name, "annotations", &T::annotations);
};

template <> struct meta<flowcore::detail::DocumentJson> {
  using T = flowcore::detail::DocumentJson;
  static constexpr auto value =
      object("kind", &T::kind, "metadata", &T::metadata, "spec", &T::spec);
};

template <> struct meta<flowcore::detail::StageOptionsJson> {
  using T = flowcore::detail::StageOptionsJson;
  static constexpr auto value = object("map_on", &T::map_on);
};

template <> struct meta<flowcore::detail::StageResourcesJson> {
  using T = flowcore::detail::StageResourcesJson;
  static constexpr auto value = object("cpus", &T::cpus, "gpus", &T::gpus,
                                       "memory", &T::memory, "labels",
                                       &T::labels);
};

template <> struct meta<flowcore::detail::StageJson> {
  using T = flowcore::detail::StageJson;
  static constexpr auto value =
      object("name", &T::name, "target", &T::target, "type", &T::type,
             "depends_on", &T::depends_on, "description", &T::description,
             "priority", &T::priority, "options", &T::options, "resources",
             &T::resources, "collect", &T::collect);
};

template <> struct meta<flowcore::detail::WorkflowSpecJson> {
  using T = flowcore::detail::WorkflowSpecJson;
  static constexpr auto value =
      object("description", &T::description, "stages", &T::stages);
};

template <> struct meta<flowcore::detail::ActionJson> {
  using T = flowcore::detail::ActionJson;
  static constexpr auto value = object("target", &T::target, "parameters",
                                       &T::parameters, "params", &T::params);
};

template <> struct meta<flowcore::detail::TriggerSpecJson> {
  using T = flowcore::detail::TriggerSpecJson;
  static constexpr auto value =
      object("type", &T::type, "rule", &T::rule, "action", &T::action);
};

template <> struct meta<flowcore::detail::ConfigSpecJson> {
  using T = flowcore::detail::ConfigSpecJson;
  static constexpr auto value =
      object("workflows", &T::workflows, "match_annotations",
             &T::match_annotations, "data", &T::data);
};
} // namespace glz

namespace flowcore {
namespace {

constexpr auto kReadOpts =
    glz::opts{.null_terminated = false, .error_on_unknown_keys = false};

template <typename T>
auto decode(std::string_view text, std::string &why) -> Result<T> {
  T out{};
  if (auto ec = glz::read<kReadOpts>(out, text); ec) {
    why = glz::format_error(ec, text);
    return fail(Error::ParseError);
  }
  return ok(std::move(out));
}

auto spec_text(const detail::DocumentJson &doc) -> std::string_view {
  return doc.spec.str.empty() ? std::string_view{"{}"}
                              : std::string_view{doc.spec.str};
}

auto to_annotations(const std::map<std::string, std::string> &in)
    -> Annotations {
  Annotations out;
  for (const auto &[k, v] : in) {
    out.insert_or_assign(k, v);
  }
  return out;
}

auto parse_stage_kind(std::string_view type) -> std::optional<StageKind> {
  // "normal" is the historical spelling of a simple stage.
  if (type == "normal") {
    return StageKind::Simple;
  }
  return util::try_parse_enum<StageKind>(type);
}

auto convert_workflow(const detail::DocumentJson &doc, std::string &why)
    -> Result<Definition> {
  auto spec = decode<detail::WorkflowSpecJson>(spec_text(doc), why);
  if (!spec) {
    return fail(spec.error());
  }
  if (spec->stages.empty()) {
    why = std::format("workflow '{}' has no stages", doc.metadata.name);
    return fail(Error::ValidationFailed);
  }

  WorkflowDefinition wf{.name = doc.metadata.name,
                        .description = std::move(spec->description),
                        .annotations = to_annotations(doc.metadata.annotations)};
  wf.stages.reserve(spec->stages.size());
  for (auto &stage : spec->stages) {
    auto kind = parse_stage_kind(stage.type);
    if (!kind) {
      why = std::format("stage '{}' has unknown type '{}'", stage.name,
                        stage.type);
      return fail(Error::ParseError);
    }
    StageDefinition out{.name = std::move(stage.name),
                        .target = std::move(stage.target),
                        .kind = *kind,
                        .depends_on = std::move(stage.depends_on),
                        .description = std::move(stage.description),
                        .priority = stage.priority,
                        .map_on = std::move(stage.options.map_on),
                        .collect = stage.collect};
    out.resources.cpus = stage.resources.cpus;
    out.resources.gpus = stage.resources.gpus;
    out.resources.memory = stage.resources.memory;
    for (const auto &[k, v] : stage.resources.labels) {
      out.resources.labels.insert_or_assign(k, v);
    }
    wf.stages.push_back(std::move(out));
  }
  return ok(Definition{std::move(wf)});
}

auto convert_trigger(const detail::DocumentJson &doc, std::string &why)
    -> Result<Definition> {
  auto spec = decode<detail::TriggerSpecJson>(spec_text(doc), why);
  if (!spec) {
    return fail(spec.error());
  }
  auto type = util::try_parse_enum<RuleType>(spec->type);
  if (!type) {
    why = std::format("trigger rule '{}' has unknown type '{}'",
                      doc.metadata.name, spec->type);
    return fail(Error::ParseError);
  }
  TriggerRuleDefinition rule{.name = doc.metadata.name,
                             .type = *type,
                             .rule = std::move(spec->rule)};
  rule.action.target = std::move(spec->action.target);
  if (spec->action.parameters) {
    rule.action.parameters = std::move(*spec->action.parameters);
  } else if (spec->action.params) {
    rule.action.parameters = std::move(*spec->action.params);
  } else {
    rule.action.parameters = make_object();
  }
  return ok(Definition{std::move(rule)});
}

auto convert_config(const detail::DocumentJson &doc, std::string &why)
    -> Result<Definition> {
  auto spec = decode<detail::ConfigSpecJson>(spec_text(doc), why);
  if (!spec) {
    return fail(spec.error());
  }
  if (!spec->data.is_null() && json::as_object(spec->data) == nullptr) {
    why = std::format("config '{}' data must be an object", doc.metadata.name);
    return fail(Error::ParseError);
  }
  ConfigGroup group{.name = doc.metadata.name,
                    .annotations = to_annotations(doc.metadata.annotations),
                    .workflows = std::move(spec->workflows),
                    .match_annotations =
                        to_annotations(spec->match_annotations),
                    .data = spec->data.is_null() ? make_object()
                                                 : std::move(spec->data)};
  return ok(Definition{std::move(group)});
}

auto convert(const detail::DocumentJson &doc, std::string &why)
    -> Result<Definition> {
  if (doc.metadata.name.empty()) {
    why = "document is missing metadata.name";
    return fail(Error::ParseError);
  }
  auto kind = util::try_parse_enum<DefinitionKind>(doc.kind);
  if (!kind) {
    why = std::format("'{}' has unknown kind '{}'", doc.metadata.name,
                      doc.kind);
    return fail(Error::ParseError);
  }
  switch (*kind) {
  case DefinitionKind::Workflow:
    return convert_workflow(doc, why);
  case DefinitionKind::TriggerRule:
    return convert_trigger(doc, why);
  case DefinitionKind::Config:
    return convert_config(doc, why);
  }
  return fail(Error::ParseError);
}

} // namespace

auto DefinitionLoader::load_from_string(std::string_view text,
                                        std::string *diagnostic)
    -> Result<std::vector<Definition>> {
  std::string why;
  auto report = [&](std::error_code ec) -> Result<std::vector<Definition>> {
    log::error("Definition parse error: {}", why);
    if (diagnostic) {
      *diagnostic = why;
    }
    return fail(ec);
  };

  auto first = std::ranges::find_if(
      text, [](char c) { return c != ' ' && c != '\n' && c != '\r' && c != '\t'; });
  std::vector<detail::DocumentJson> docs;
  if (first != text.end() && *first == '[') {
    auto parsed = decode<std::vector<detail::DocumentJson>>(text, why);
    if (!parsed) {
      return report(parsed.error());
    }
    docs = std::move(*parsed);
  } else {
    auto parsed = decode<detail::DocumentJson>(text, why);
    if (!parsed) {
      return report(parsed.error());
    }
    docs.push_back(std::move(*parsed));
  }

  std::vector<Definition> out;
  out.reserve(docs.size());
  for (const auto &doc : docs) {
    auto def = convert(doc, why);
    if (!def) {
      return report(def.error());
    }
    out.push_back(std::move(*def));
  }
  return ok(std::move(out));
}

auto DefinitionLoader::load_from_file(std::string_view path,
                                      std::string *diagnostic)
    -> Result<std::vector<Definition>> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("{}: {}", path, text.error().message());
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

} // namespace flowcore
