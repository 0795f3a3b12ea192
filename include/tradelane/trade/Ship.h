#pragma once

#include <string>

namespace tradelane::trade {

struct Ship {
  std::string name;
  double cargoScu{0.0};

  bool hasLoadingDock{false};
  bool hasFreightElevator{false};

  // Ships like the Hull-C can only be (un)loaded at a terminal with a loading dock.
  bool requiresLoadingDock{false};
};

} // namespace tradelane::trade
