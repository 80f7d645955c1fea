#include "flowcore/executor/target_registry.hpp"

#include "flowcore/util/log.hpp"

#include <ranges>

namespace flowcore {

auto TargetRegistry::register_target(std::string target, StageFunction fn)
    -> void {
  std::lock_guard lock(mu_);
  log::debug("Registered stage target '{}'", target);
  targets_.insert_or_assign(std::move(target), std::move(fn));
}

auto TargetRegistry::resolve(std::string_view target) const
    -> Result<StageFunction> {
  std::lock_guard lock(mu_);
  auto it = targets_.find(target);
  if (it == targets_.end()) {
    return fail(Error::ResolutionFailed);
  }
  return ok(it->second);
}

auto TargetRegistry::contains(std::string_view target) const -> bool {
  std::lock_guard lock(mu_);
  return targets_.contains(target);
}

auto TargetRegistry::targets() const -> std::vector<std::string> {
  std::lock_guard lock(mu_);
  return targets_ | std::views::keys | std::ranges::to<std::vector>();
}

} // namespace flowcore
