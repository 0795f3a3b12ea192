#include "tradelane/trade/LegalityFilter.h"

namespace tradelane::trade {

std::string_view toString(RejectReason r) {
  switch (r) {
    case RejectReason::None:                   return "none";
    case RejectReason::IllegalCommodity:       return "illegal-commodity";
    case RejectReason::DockRequiredByTerminal: return "dock-required-by-terminal";
    case RejectReason::DockRequiredByShip:     return "dock-required-by-ship";
    case RejectReason::NotListed:              return "not-listed";
  }
  return "unknown";
}

RejectReason checkLeg(const market::Commodity& commodity,
                      LegSide side,
                      const Ship& ship,
                      const market::Terminal& terminal) {
  if (!commodity.legal) return RejectReason::IllegalCommodity;

  if (terminal.requiresLoadingDock && !ship.hasLoadingDock) return RejectReason::DockRequiredByTerminal;
  if (ship.requiresLoadingDock && !terminal.hasLoadingDock) return RejectReason::DockRequiredByShip;

  const market::CommodityListing* l = commodity.listingAt(terminal.id);
  if (!l) return RejectReason::NotListed;
  if (side == LegSide::Buy && !l->buyable()) return RejectReason::NotListed;
  if (side == LegSide::Sell && !l->sellable()) return RejectReason::NotListed;

  return RejectReason::None;
}

} // namespace tradelane::trade
