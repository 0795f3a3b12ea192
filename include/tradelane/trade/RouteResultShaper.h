#pragma once

#include "tradelane/market/Catalog.h"
#include "tradelane/trade/ProfitCalculator.h"
#include "tradelane/trade/RouteOptimizer.h"
#include "tradelane/trade/TradeStatus.h"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace tradelane::core { class JsonWriter; }

namespace tradelane::trade {

// Caller-facing view of one route. Names are resolved, numbers kept raw.
struct ShapedRoute {
  std::size_t rank{0};

  std::string commodity;
  std::string commodityCode;
  std::string buyTerminal;
  std::string sellTerminal;

  double buyPrice{0.0};
  double sellPrice{0.0};
  double quantity{0.0};
  double absoluteProfit{0.0};

  std::string buyInventory;  // buy-side status at the buy terminal
  std::string sellInventory; // sell-side status at the sell terminal

  // Advanced info; only filled (and emitted) when RouteReport::advancedInfo.
  double marginPercent{0.0};
  double baseProfitPercent{0.0};
  std::string marginText;     // "150%", "minus 12.5%"
  std::string baseProfitText;
  bool buyMonitored{false};
  bool sellMonitored{false};
  double score{0.0};
  std::string buyLocation;
  std::string sellLocation;
  double rawStockScu{0.0};
  double estimatedStockScu{0.0};
  double reportAgeHours{0.0};
};

struct RouteReport {
  TradeStatus status{TradeStatus::OkNoProfitableRoute};

  std::vector<ShapedRoute> routes;

  // Profitable routes available before truncation.
  std::size_t totalAvailable{0};
  bool truncated{false};
  bool advancedInfo{false};

  // Short human-readable summary (also carries the reason for error statuses).
  std::string message;

  // Lines the caller must pass on to the user verbatim.
  std::vector<std::string> notices;
};

struct ShapeOptions {
  bool advancedInfo{false};
  std::size_t limit{5};
};

// "150%", "12.5%", "minus 12.5%". One decimal at most; "-0" prints as "0%".
std::string formatPercent(double percent);

RouteReport shapeRouteReport(const OptimizeResult& result,
                             const market::MarketSnapshot& snapshot,
                             const ShapeOptions& options);

// Report for a query that never reached the optimizer.
RouteReport makeStatusReport(TradeStatus status, std::string message);

void writeRouteReportJson(core::JsonWriter& w, const RouteReport& report);
void writeRouteReportText(std::ostream& out, const RouteReport& report);

struct ProfitReport {
  TradeStatus status{TradeStatus::InvalidInput};
  ProfitFigures figures{};
  bool hasQuantity{false};

  std::string marginText;
  std::string baseProfitText;
  std::string message;
};

// hasQuantity == false reports only the per-unit figures.
ProfitReport shapeProfitReport(const ProfitFigures& figures, bool hasQuantity);

void writeProfitReportJson(core::JsonWriter& w, const ProfitReport& report);
void writeProfitReportText(std::ostream& out, const ProfitReport& report);

} // namespace tradelane::trade
