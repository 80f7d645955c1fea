#pragma once

#include "flowcore/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>

namespace flowcore {

// Fallback tries cluster memory, then the artifact tier.
enum class Strategy : std::uint8_t { Fallback, Artifact, ClusterMemory };
BOOST_DESCRIBE_ENUM(Strategy, Fallback, Artifact, ClusterMemory)
FLOWCORE_DEFINE_ENUM_SERDE(Strategy)

} // namespace flowcore
