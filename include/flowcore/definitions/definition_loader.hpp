#pragma once

#include "flowcore/core/error.hpp"
#include "flowcore/definitions/definition.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace flowcore {

// Parses JSON resource documents of the form
//   {"kind": "workflow", "metadata": {"name": ..., "annotations": {...}},
//    "spec": {...}}
// A file may hold one document or an array of them.
class DefinitionLoader {
public:
  [[nodiscard]] static auto load_from_string(std::string_view text,
                                             std::string *diagnostic = nullptr)
      -> Result<std::vector<Definition>>;
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           std::string *diagnostic = nullptr)
      -> Result<std::vector<Definition>>;
};

} // namespace flowcore
