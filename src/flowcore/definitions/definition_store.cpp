#include "flowcore/definitions/definition_store.hpp"

#include "flowcore/definitions/definition_loader.hpp"
#include "flowcore/util/log.hpp"
#include "flowcore/util/util.hpp"

#include <algorithm>

namespace flowcore {

auto InMemoryDefinitionStore::apply(Definition definition) -> void {
  DefinitionChange change{.kind = definition.kind(),
                          .name = definition.name()};
  {
    std::lock_guard lock(mu_);
    std::visit(
        overloaded{
            [&](WorkflowDefinition &wf) {
              auto name = wf.name;
              workflows_.insert_or_assign(
                  std::move(name),
                  std::make_shared<const WorkflowDefinition>(std::move(wf)));
            },
            [&](TriggerRuleDefinition &rule) {
              auto name = rule.name;
              triggers_.insert_or_assign(std::move(name), std::move(rule));
            },
            [&](ConfigGroup &group) {
              auto name = group.name;
              configs_.insert_or_assign(std::move(name), std::move(group));
            },
        },
        definition.value);
  }
  log::debug("Definition applied: {} {}", to_string_view(change.kind),
             change.name);
  notify(change);
}

auto InMemoryDefinitionStore::remove(DefinitionKind kind, std::string_view name)
    -> Result<void> {
  bool erased = false;
  {
    std::lock_guard lock(mu_);
    auto erase_from = [&](auto &map) {
      if (auto it = map.find(name); it != map.end()) {
        map.erase(it);
        erased = true;
      }
    };
    switch (kind) {
    case DefinitionKind::Workflow:
      erase_from(workflows_);
      break;
    case DefinitionKind::TriggerRule:
      erase_from(triggers_);
      break;
    case DefinitionKind::Config:
      erase_from(configs_);
      break;
    }
  }
  if (!erased) {
    return fail(Error::NotFound);
  }
  notify(DefinitionChange{
      .kind = kind, .name = std::string(name), .removed = true});
  return ok();
}

auto InMemoryDefinitionStore::get_workflow(std::string_view name) const
    -> Result<std::shared_ptr<const WorkflowDefinition>> {
  std::lock_guard lock(mu_);
  auto it = workflows_.find(name);
  if (it == workflows_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto InMemoryDefinitionStore::get_trigger(std::string_view name) const
    -> Result<TriggerRuleDefinition> {
  std::lock_guard lock(mu_);
  auto it = triggers_.find(name);
  if (it == triggers_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto InMemoryDefinitionStore::list_workflows() const
    -> std::vector<std::string> {
  std::lock_guard lock(mu_);
  std::vector<std::string> out;
  out.reserve(workflows_.size());
  for (const auto &[name, wf] : workflows_) {
    out.push_back(name);
  }
  return out;
}

auto InMemoryDefinitionStore::list_triggers() const
    -> std::vector<TriggerRuleDefinition> {
  std::lock_guard lock(mu_);
  std::vector<TriggerRuleDefinition> out;
  out.reserve(triggers_.size());
  for (const auto &[name, rule] : triggers_) {
    out.push_back(rule);
  }
  return out;
}

auto InMemoryDefinitionStore::configs_for(const WorkflowDefinition &workflow)
    const -> JsonValue {
  auto merged = make_object();
  std::lock_guard lock(mu_);
  for (const auto &[name, group] : configs_) {
    if (!group.selects(workflow)) {
      continue;
    }
    if (const auto *data = json::as_object(group.data)) {
      for (const auto &[key, value] : *data) {
        merged.get_object()[key] = value;
      }
    }
  }
  return merged;
}

auto InMemoryDefinitionStore::subscribe(DefinitionListener listener)
    -> std::uint64_t {
  std::lock_guard lock(mu_);
  auto id = next_listener_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

auto InMemoryDefinitionStore::unsubscribe(std::uint64_t id) -> void {
  std::lock_guard lock(mu_);
  std::erase_if(listeners_, [id](const auto &entry) { return entry.first == id; });
}

auto InMemoryDefinitionStore::notify(const DefinitionChange &change) -> void {
  std::vector<DefinitionListener> listeners;
  {
    std::lock_guard lock(mu_);
    listeners.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto &listener : listeners) {
    listener(change);
  }
}

DirectoryDefinitionStore::DirectoryDefinitionStore(
    std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto DirectoryDefinitionStore::load_all() -> Result<std::size_t> {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    log::warn("Definition directory does not exist: {}", directory_.string());
    return fail(Error::FileNotFound);
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry :
       std::filesystem::directory_iterator(directory_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    log::error("Failed to list {}: {}", directory_.string(), ec.message());
    return fail(ec);
  }
  std::ranges::sort(files);

  std::size_t loaded = 0;
  for (const auto &path : files) {
    std::string why;
    if (auto r = reload_file(path, &why); !r) {
      log::warn("Skipping {}: {}", path.string(), why);
      continue;
    }
    std::lock_guard lock(files_mu_);
    loaded += files_[path].size();
  }
  log::info("Loaded {} definition(s) from {}", loaded, directory_.string());
  return ok(loaded);
}

auto DirectoryDefinitionStore::reload_file(const std::filesystem::path &path,
                                           std::string *diagnostic)
    -> Result<void> {
  auto defs = DefinitionLoader::load_from_file(path.string(), diagnostic);
  if (!defs) {
    return fail(defs.error());
  }

  std::vector<Origin> declared;
  declared.reserve(defs->size());
  for (const auto &def : *defs) {
    declared.emplace_back(def.kind(), def.name());
  }

  std::vector<Origin> stale;
  {
    std::lock_guard lock(files_mu_);
    auto &owned = files_[path];
    for (const auto &origin : owned) {
      if (std::ranges::find(declared, origin) == declared.end()) {
        stale.push_back(origin);
      }
    }
    owned = declared;
  }

  for (auto &def : *defs) {
    apply(std::move(def));
  }
  for (const auto &[kind, name] : stale) {
    (void)remove(kind, name).or_else([&](std::error_code) -> Result<void> {
      log::debug("{} {} was already removed", to_string_view(kind), name);
      return ok();
    });
  }
  log::info("Loaded {} definition(s) from {}", declared.size(), path.string());
  return ok();
}

auto DirectoryDefinitionStore::remove_file(const std::filesystem::path &path)
    -> void {
  std::vector<Origin> owned;
  {
    std::lock_guard lock(files_mu_);
    auto it = files_.find(path);
    if (it == files_.end()) {
      return;
    }
    owned = std::move(it->second);
    files_.erase(it);
  }
  for (const auto &[kind, name] : owned) {
    (void)remove(kind, name).or_else([&](std::error_code) -> Result<void> {
      log::debug("{} {} was already removed", to_string_view(kind), name);
      return ok();
    });
  }
  log::info("Removed definitions of {}", path.string());
}

} // namespace flowcore
