#include "tradelane/trade/RoutePlanner.h"

#include "tradelane/core/JobSystem.h"
#include "tradelane/core/Log.h"
#include "tradelane/trade/RouteOptimizer.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradelane::trade {

static constexpr const char* kChannel = "trade";

std::size_t resolveRouteLimit(const TradeConstraints& c, const TradeConfig& config) {
  if (c.count > 0) return c.count;
  const std::size_t def = std::max<std::size_t>(1, config.routeDefaultCount);
  return std::min(def, std::max<std::size_t>(1, config.listLimit));
}

static RouteReport reject(TradeStatus status, const std::string& message) {
  TRADELANE_LOG_WARN(kChannel, std::string("route query rejected (") + std::string(toString(status)) + "): " + message);
  return makeStatusReport(status, message);
}

RouteReport planTradeRoutes(const market::MarketSnapshot& snapshot,
                            const TradeConstraints& constraints,
                            const TradeConfig& config,
                            core::JobSystem* jobs,
                            CandidateBuildStats* outStats) {
  if (outStats) *outStats = CandidateBuildStats{};

  if (!config.toolCommodityRoute) {
    return reject(TradeStatus::ToolDisabled, "Commodity route search is disabled.");
  }

  const Ship& ship = constraints.ship;
  if (!std::isfinite(ship.cargoScu) || ship.cargoScu <= 0.0) {
    return reject(TradeStatus::InvalidInput, "Ship cargo capacity must be a positive number of SCU.");
  }
  if (!std::isfinite(constraints.budget) || constraints.budget <= 0.0) {
    return reject(TradeStatus::InvalidInput, "Budget must be a positive amount.");
  }
  if (!std::isfinite(constraints.nowSec)) {
    return reject(TradeStatus::InvalidInput, "Query time must be finite.");
  }

  if (snapshot.empty()) {
    return reject(TradeStatus::NoCatalogData, "No commodity data is available.");
  }

  if (!constraints.location.empty() && !snapshot.locationKnown(constraints.location)) {
    return reject(TradeStatus::InvalidInput, "Unknown location '" + constraints.location + "'.");
  }

  CandidateParams params;
  params.ship = ship;
  params.budget = constraints.budget;
  params.location = constraints.location;
  params.availability.useEstimated = constraints.useEstimatedAvailability.value_or(config.useEstimatedAvailability);
  params.availability.nowSec = constraints.nowSec;
  params.availability.defaultReplenishScuPerHour = config.replenishScuPerHour;

  if (!constraints.commodity.empty()) {
    const market::Commodity* c = snapshot.findCommodityByName(constraints.commodity);
    if (!c) return reject(TradeStatus::InvalidInput, "Unknown commodity '" + constraints.commodity + "'.");
    params.commodityFilterEnabled = true;
    params.commodityFilter = c->id;
  }

  CandidateBuildStats stats;
  const std::vector<CandidateLeg> legs = jobs
    ? buildCandidateLegsParallel(*jobs, snapshot, params, &stats)
    : buildCandidateLegs(snapshot, params, &stats);
  if (outStats) *outStats = stats;

  if (core::logEnabled(core::LogLevel::Debug)) {
    std::ostringstream oss;
    oss << "candidates: commodities=" << stats.commoditiesScanned
        << " illegal=" << stats.illegalCommoditiesSkipped
        << " legalityRejects=" << stats.legalityRejections
        << " quantityRejects=" << stats.quantityRejections
        << " legs=" << stats.legs
        << (jobs ? " (parallel)" : "");
    TRADELANE_LOG_DEBUG(kChannel, oss.str());
  }

  const std::size_t limit = resolveRouteLimit(constraints, config);
  const OptimizeResult best = optimizeRoutes(legs, snapshot, limit);

  if (core::logEnabled(core::LogLevel::Debug)) {
    std::ostringstream oss;
    oss << "optimize: profitable=" << best.totalProfitable << " returned=" << best.routes.size()
        << " limit=" << limit;
    TRADELANE_LOG_DEBUG(kChannel, oss.str());
  }

  ShapeOptions shape;
  shape.advancedInfo = constraints.advancedInfo.value_or(config.advancedInfo);
  shape.limit = limit;
  return shapeRouteReport(best, snapshot, shape);
}

ProfitReport runProfitTool(const TradeConfig& config,
                           double buyPrice,
                           double sellPrice,
                           std::optional<double> quantity) {
  ProfitReport rep;

  if (!config.toolProfitCalculation) {
    rep.status = TradeStatus::ToolDisabled;
    rep.message = "Profit calculation is disabled.";
    TRADELANE_LOG_WARN(kChannel, "profit query rejected (tool-disabled)");
    return rep;
  }

  ProfitFigures f;
  std::string err;
  if (!calculateProfit(buyPrice, sellPrice, quantity.value_or(1.0), f, &err)) {
    rep.status = TradeStatus::InvalidInput;
    rep.message = err;
    TRADELANE_LOG_WARN(kChannel, "profit query rejected (invalid-input): " + err);
    return rep;
  }

  return shapeProfitReport(f, quantity.has_value());
}

} // namespace tradelane::trade
