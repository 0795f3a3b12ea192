#include "tradelane/trade/TradeConfig.h"

#include "tradelane/core/CVar.h"
#include "tradelane/core/Log.h"

#include <cmath>
#include <cstdint>

namespace tradelane::trade {

bool registerTradeCVars(core::CVarRegistry& reg) {
  const TradeConfig d{};
  bool ok = true;

  ok &= reg.defineBool(option::kToolCommodityRoute, d.toolCommodityRoute,
                       "Provide commodity trade routes (legal commodities only).");
  ok &= reg.defineBool(option::kToolProfitCalculation, d.toolProfitCalculation,
                       "Provide absolute profit, margin and base profit for a buy/sell price pair.");
  ok &= reg.defineInt(option::kRouteDefaultCount, (std::int64_t)d.routeDefaultCount,
                      "Number of trade routes returned when the caller does not ask for a count.");
  ok &= reg.defineBool(option::kRouteUseEstimatedAvailability, d.useEstimatedAvailability,
                       "Project stale stock reports to query time instead of using raw SCU figures.");
  ok &= reg.defineBool(option::kRouteAdvancedInfo, d.advancedInfo,
                       "Include margins, location paths, monitoring flags and scores in route output.");
  ok &= reg.defineInt(option::kListLimit, (std::int64_t)d.listLimit,
                      "Maximum entries in list-shaped output unless the caller asks for more.");
  ok &= reg.defineFloat(option::kReplenishScuPerHour, d.replenishScuPerHour,
                        "Default stock recovery rate (SCU/hour) for the availability estimate.");
  ok &= reg.defineInt(option::kWorkerThreads, (std::int64_t)d.workerThreads,
                      "Candidate builder threads (0 = hardware threads, 1 = serial).");
  ok &= reg.defineString(option::kLogLevel, d.logLevel,
                         "Log level: trace|debug|info|warn|error|off");
  return ok;
}

bool loadTradeConfig(const core::CVarRegistry& reg, TradeConfig& out, std::string* outError) {
  auto fail = [&](const std::string& msg) {
    if (outError) *outError = msg;
    return false;
  };

  TradeConfig c;
  c.toolCommodityRoute = reg.getBool(option::kToolCommodityRoute, c.toolCommodityRoute);
  c.toolProfitCalculation = reg.getBool(option::kToolProfitCalculation, c.toolProfitCalculation);
  c.useEstimatedAvailability = reg.getBool(option::kRouteUseEstimatedAvailability, c.useEstimatedAvailability);
  c.advancedInfo = reg.getBool(option::kRouteAdvancedInfo, c.advancedInfo);

  const std::int64_t count = reg.getInt(option::kRouteDefaultCount, (std::int64_t)c.routeDefaultCount);
  if (count < 1) return fail(std::string(option::kRouteDefaultCount) + " must be at least 1");
  c.routeDefaultCount = (std::size_t)count;

  const std::int64_t limit = reg.getInt(option::kListLimit, (std::int64_t)c.listLimit);
  if (limit < 1) return fail(std::string(option::kListLimit) + " must be at least 1");
  c.listLimit = (std::size_t)limit;

  const double rate = reg.getFloat(option::kReplenishScuPerHour, c.replenishScuPerHour);
  if (!std::isfinite(rate) || rate < 0.0) {
    return fail(std::string(option::kReplenishScuPerHour) + " must be a non-negative number");
  }
  c.replenishScuPerHour = rate;

  const std::int64_t threads = reg.getInt(option::kWorkerThreads, (std::int64_t)c.workerThreads);
  if (threads < 0) return fail(std::string(option::kWorkerThreads) + " must not be negative");
  c.workerThreads = (std::size_t)threads;

  c.logLevel = reg.getString(option::kLogLevel, c.logLevel);
  core::LogLevel lvl;
  if (!core::tryParseLogLevel(c.logLevel, lvl)) {
    return fail(std::string(option::kLogLevel) + ": expected trace|debug|info|warn|error|off, got '" + c.logLevel + "'");
  }

  out = c;
  return true;
}

} // namespace tradelane::trade
