#pragma once

#include "tradelane/market/Catalog.h"
#include "tradelane/trade/CandidateGraphBuilder.h"
#include "tradelane/trade/RouteResultShaper.h"
#include "tradelane/trade/Ship.h"
#include "tradelane/trade/TradeConfig.h"

#include <cstddef>
#include <optional>
#include <string>

namespace tradelane::core { class JobSystem; }

namespace tradelane::trade {

struct TradeConstraints {
  Ship ship{};
  double budget{0.0};

  // Terminal, station, planet or system name. Empty = anywhere.
  std::string location;

  // 0 = TradeConfig::routeDefaultCount.
  std::size_t count{0};

  // Unset = use TradeConfig.
  std::optional<bool> useEstimatedAvailability;
  std::optional<bool> advancedInfo;

  // Commodity code or name. Empty = all commodities.
  std::string commodity;

  // Same clock as the snapshot's report timestamps.
  double nowSec{0.0};
};

// Number of routes a query returns: an explicit count wins, otherwise the
// configured default capped at the list limit.
std::size_t resolveRouteLimit(const TradeConstraints& c, const TradeConfig& config);

// Best commodity trade routes for the given ship, budget and location.
//
// Status:
//  - ToolDisabled        tool_commodity_route is off
//  - InvalidInput        bad budget/cargo, unknown location or commodity
//  - NoCatalogData       snapshot has no commodities or no terminals
//  - OkNoProfitableRoute nothing profitable (empty list, total 0)
//  - OkWithRoutes        otherwise
//
// Candidate building fans out over `jobs` when given.
RouteReport planTradeRoutes(const market::MarketSnapshot& snapshot,
                            const TradeConstraints& constraints,
                            const TradeConfig& config,
                            core::JobSystem* jobs = nullptr,
                            CandidateBuildStats* outStats = nullptr);

// Standalone profit calculation. Without a quantity only per-unit figures are
// reported.
ProfitReport runProfitTool(const TradeConfig& config,
                           double buyPrice,
                           double sellPrice,
                           std::optional<double> quantity = std::nullopt);

} // namespace tradelane::trade
