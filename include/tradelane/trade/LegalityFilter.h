#pragma once

#include "tradelane/core/Types.h"
#include "tradelane/market/Catalog.h"
#include "tradelane/trade/Ship.h"

#include <string_view>

namespace tradelane::trade {

enum class LegSide : core::u8 {
  Buy = 0,  // player buys at the terminal
  Sell,     // player sells at the terminal
};

enum class RejectReason : core::u8 {
  None = 0,
  IllegalCommodity,
  DockRequiredByTerminal, // terminal needs a loading dock the ship lacks
  DockRequiredByShip,     // ship needs a loading dock the terminal lacks
  NotListed,              // commodity not tradeable on that side at the terminal
};

std::string_view toString(RejectReason r);

// Legality and logistics rules for one side of a leg. Pure; no I/O.
//
// A freight elevator never satisfies a loading-dock requirement.
RejectReason checkLeg(const market::Commodity& commodity,
                      LegSide side,
                      const Ship& ship,
                      const market::Terminal& terminal);

inline bool legAllowed(const market::Commodity& commodity,
                       LegSide side,
                       const Ship& ship,
                       const market::Terminal& terminal) {
  return checkLeg(commodity, side, ship, terminal) == RejectReason::None;
}

} // namespace tradelane::trade
