#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/definitions/definition.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowcore {

using DefinitionListener = std::function<void(const DefinitionChange &)>;

// Read side of the definition store consumed by the coordinator and the
// trigger service.
class IDefinitionStore {
public:
  virtual ~IDefinitionStore() = default;

  [[nodiscard]] virtual auto get_workflow(std::string_view name) const
      -> Result<std::shared_ptr<const WorkflowDefinition>> = 0;
  [[nodiscard]] virtual auto get_trigger(std::string_view name) const
      -> Result<TriggerRuleDefinition> = 0;
  [[nodiscard]] virtual auto list_workflows() const
      -> std::vector<std::string> = 0;
  [[nodiscard]] virtual auto list_triggers() const
      -> std::vector<TriggerRuleDefinition> = 0;
  // Data of every config group selecting `workflow`, merged in group name
  // order; later groups override earlier keys.
  [[nodiscard]] virtual auto configs_for(const WorkflowDefinition &workflow)
      const -> JsonValue = 0;

  virtual auto subscribe(DefinitionListener listener) -> std::uint64_t = 0;
  virtual auto unsubscribe(std::uint64_t id) -> void = 0;
};

class InMemoryDefinitionStore : public IDefinitionStore {
public:
  InMemoryDefinitionStore() = default;

  // Adds or replaces; listeners are told afterwards.
  auto apply(Definition definition) -> void;
  auto remove(DefinitionKind kind, std::string_view name) -> Result<void>;

  auto put_workflow(WorkflowDefinition wf) -> void {
    apply(Definition{std::move(wf)});
  }
  auto put_trigger(TriggerRuleDefinition rule) -> void {
    apply(Definition{std::move(rule)});
  }
  auto put_config(ConfigGroup group) -> void {
    apply(Definition{std::move(group)});
  }

  [[nodiscard]] auto get_workflow(std::string_view name) const
      -> Result<std::shared_ptr<const WorkflowDefinition>> override;
  [[nodiscard]] auto get_trigger(std::string_view name) const
      -> Result<TriggerRuleDefinition> override;
  [[nodiscard]] auto list_workflows() const
      -> std::vector<std::string> override;
  [[nodiscard]] auto list_triggers() const
      -> std::vector<TriggerRuleDefinition> override;
  [[nodiscard]] auto configs_for(const WorkflowDefinition &workflow) const
      -> JsonValue override;

  auto subscribe(DefinitionListener listener) -> std::uint64_t override;
  auto unsubscribe(std::uint64_t id) -> void override;

private:
  auto notify(const DefinitionChange &change) -> void;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<const WorkflowDefinition>, std::less<>>
      workflows_;
  std::map<std::string, TriggerRuleDefinition, std::less<>> triggers_;
  std::map<std::string, ConfigGroup, std::less<>> configs_;
  std::vector<std::pair<std::uint64_t, DefinitionListener>> listeners_;
  std::uint64_t next_listener_{1};
};

// Definitions loaded from the *.json files of one directory. Each file owns
// the definitions it declared; reloading a file drops the ones it no longer
// declares.
class DirectoryDefinitionStore : public InMemoryDefinitionStore {
public:
  explicit DirectoryDefinitionStore(std::filesystem::path directory);

  // Files that fail to parse are logged and skipped. Returns the number of
  // definitions loaded.
  auto load_all() -> Result<std::size_t>;
  auto reload_file(const std::filesystem::path &path,
                   std::string *diagnostic = nullptr) -> Result<void>;
  auto remove_file(const std::filesystem::path &path) -> void;

  [[nodiscard]] auto directory() const -> const std::filesystem::path & {
    return directory_;
  }

private:
  using Origin = std::pair<DefinitionKind, std::string>;

  std::filesystem::path directory_;
  std::mutex files_mu_;
  std::map<std::filesystem::path, std::vector<Origin>> files_;
};

} // namespace flowcore
