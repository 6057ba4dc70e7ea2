#pragma once
#include <cstdint>
#include "model/IdleState.hpp"

namespace idlectl::model {

struct MsrUpdate {
  ProcessorId cpu{};
  uint64_t before{};
  uint64_t written{};
  uint64_t after{};
  bool verified() const { return after == written; }
};

} // namespace idlectl::model
