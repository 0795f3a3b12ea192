#pragma once

#include <cstddef>
#include <string>

namespace tradelane::core { class CVarRegistry; }

namespace tradelane::trade {

// Option names as they appear in config files.
namespace option {
inline constexpr const char* kToolCommodityRoute = "tool_commodity_route";
inline constexpr const char* kToolProfitCalculation = "tool_profit_calculation";
inline constexpr const char* kRouteDefaultCount = "commodity_route_default_count";
inline constexpr const char* kRouteUseEstimatedAvailability = "commodity_route_use_estimated_availability";
inline constexpr const char* kRouteAdvancedInfo = "commodity_route_advanced_info";
inline constexpr const char* kListLimit = "list_limit";
inline constexpr const char* kReplenishScuPerHour = "availability_replenish_scu_per_hour";
inline constexpr const char* kWorkerThreads = "worker_threads";
inline constexpr const char* kLogLevel = "log_level";
} // namespace option

// Every recognized option, passed explicitly into each query.
struct TradeConfig {
  bool toolCommodityRoute{true};
  bool toolProfitCalculation{true};

  std::size_t routeDefaultCount{1};
  bool useEstimatedAvailability{true};
  bool advancedInfo{false};

  // Cap for list-shaped output unless a caller asks for a specific count.
  std::size_t listLimit{5};

  // Replenish rate for listings that do not carry their own.
  double replenishScuPerHour{40.0};

  // 0 = one per hardware thread; 1 = build candidates on the calling thread.
  std::size_t workerThreads{0};

  std::string logLevel{"info"};
};

// Defines all options with TradeConfig{} defaults. Returns false on a type clash
// with an existing definition.
bool registerTradeCVars(core::CVarRegistry& reg);

// Reads and range-checks the options. `out` is only assigned on success.
bool loadTradeConfig(const core::CVarRegistry& reg, TradeConfig& out, std::string* outError = nullptr);

} // namespace tradelane::trade
