#pragma once

#include "tradelane/core/Types.h"

#include <string_view>

namespace tradelane::trade {

// Outcome of a route query or a tool call.
//
// OkNoProfitableRoute is a normal answer, not an error. NoCatalogData is kept
// distinct from it so callers can tell "nothing to trade" from "no data".
enum class TradeStatus : core::u8 {
  OkWithRoutes = 0,
  OkNoProfitableRoute,
  InvalidInput,
  NoCatalogData,
  ToolDisabled,
};

inline std::string_view toString(TradeStatus s) {
  switch (s) {
    case TradeStatus::OkWithRoutes:        return "ok-with-routes";
    case TradeStatus::OkNoProfitableRoute: return "ok-no-profitable-route";
    case TradeStatus::InvalidInput:        return "invalid-input";
    case TradeStatus::NoCatalogData:       return "no-catalog-data";
    case TradeStatus::ToolDisabled:        return "tool-disabled";
  }
  return "unknown";
}

inline bool isOk(TradeStatus s) {
  return s == TradeStatus::OkWithRoutes || s == TradeStatus::OkNoProfitableRoute;
}

} // namespace tradelane::trade
