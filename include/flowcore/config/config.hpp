#pragma once

#include "flowcore/config/system_config.hpp"
#include "flowcore/core/error.hpp"

#include <string_view>

namespace flowcore {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace flowcore
