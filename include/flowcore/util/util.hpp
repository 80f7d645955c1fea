#pragma once

#include "flowcore/util/conv.hpp"
#include "flowcore/util/enum.hpp"
#include "flowcore/util/hash.hpp"
#include "flowcore/util/time.hpp"

namespace flowcore {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace flowcore
