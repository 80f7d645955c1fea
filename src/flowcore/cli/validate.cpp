#include "flowcore/cli/commands.hpp"
#include "flowcore/cli/formatting.hpp"
#include "flowcore/dag/compiler.hpp"
#include "flowcore/definitions/definition.hpp"
#include "flowcore/definitions/definition_loader.hpp"
#include "flowcore/trigger/trigger_rule.hpp"
#include "flowcore/util/json.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/util.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <optional>
#include <print>
#include <variant>
#include <vector>

namespace flowcore::cli {

namespace {

struct ValidationResult {
  std::string file;
  std::string kind;
  std::string name;
  bool valid{false};
  std::string error;
};

auto check_definition(const Definition &definition)
    -> std::optional<std::string> {
  return std::visit(
      overloaded{
          [](const WorkflowDefinition &wf) -> std::optional<std::string> {
            CompileDiagnostic diagnostic;
            if (auto graph = compile(wf, &diagnostic); !graph) {
              return diagnostic.message.empty() ? graph.error().message()
                                                : diagnostic.message;
            }
            return std::nullopt;
          },
          [](const TriggerRuleDefinition &rule) -> std::optional<std::string> {
            std::string diagnostic;
            if (auto compiled = compile_rule(rule, &diagnostic); !compiled) {
              return diagnostic.empty() ? compiled.error().message()
                                        : diagnostic;
            }
            return std::nullopt;
          },
          [](const ConfigGroup &) -> std::optional<std::string> {
            return std::nullopt;
          },
      },
      definition.value);
}

auto validate_file(const std::filesystem::path &path)
    -> std::vector<ValidationResult> {
  std::vector<ValidationResult> out;
  std::string diagnostic;
  auto loaded = DefinitionLoader::load_from_file(path.string(), &diagnostic);
  if (!loaded) {
    out.push_back(ValidationResult{
        .file = path.string(),
        .kind = "file",
        .name = path.filename().string(),
        .valid = false,
        .error = diagnostic.empty() ? loaded.error().message() : diagnostic});
    return out;
  }
  for (const auto &definition : *loaded) {
    auto error = check_definition(definition);
    out.push_back(ValidationResult{
        .file = path.string(),
        .kind = std::string(to_string_view(definition.kind())),
        .name = definition.name(),
        .valid = !error.has_value(),
        .error = error.value_or("")});
  }
  return out;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  std::vector<ValidationResult> results;
  for (const auto &file : opts.files) {
    auto per_file = validate_file(file);
    std::ranges::move(per_file, std::back_inserter(results));
  }

  const auto invalid_count = std::ranges::count_if(
      results, [](const ValidationResult &vr) { return !vr.valid; });
  const auto valid_count =
      static_cast<std::int64_t>(results.size()) - invalid_count;

  if (opts.json) {
    JsonValue arr = make_array();
    for (const auto &vr : results) {
      JsonValue obj{
          {"file", vr.file},
          {"kind", vr.kind},
          {"name", vr.name},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", static_cast<std::int64_t>(valid_count)},
             {"invalid", static_cast<std::int64_t>(invalid_count)},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} {} - {}", fmt::ansi::green("✓"), vr.kind,
                     vr.name, fmt::ansi::green("Valid"));
      } else {
        std::println("{} {} {} ({}) - {}", fmt::ansi::red("✗"), vr.kind,
                     vr.name, vr.file, fmt::ansi::red(vr.error));
      }
    }
    std::println("\nSummary: {} valid, {} invalid out of {} definition(s)",
                 fmt::ansi::green(std::format("{}", valid_count)),
                 invalid_count > 0
                     ? fmt::ansi::red(std::format("{}", invalid_count))
                     : std::format("{}", invalid_count),
                 results.size());
  }

  return invalid_count > 0 || results.empty() ? 1 : 0;
}

} // namespace flowcore::cli
