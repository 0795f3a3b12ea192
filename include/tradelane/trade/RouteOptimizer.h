#pragma once

#include "tradelane/market/Catalog.h"
#include "tradelane/trade/CandidateGraphBuilder.h"
#include "tradelane/trade/ProfitCalculator.h"
#include "tradelane/trade/TradeStatus.h"

#include <cstddef>
#include <vector>

namespace tradelane::trade {

struct RankedRoute {
  CandidateLeg leg{};
  ProfitFigures profit{};

  std::size_t rank{0}; // 1-based

  // 0..100; see scoreRoute().
  double score{0.0};
  bool buyMonitored{false};
  bool sellMonitored{false};
};

struct OptimizeResult {
  TradeStatus status{TradeStatus::OkNoProfitableRoute};
  std::vector<RankedRoute> routes;

  // Profitable candidates before truncation to `count`.
  std::size_t totalProfitable{0};
};

// Total order used for ranking: profit desc, margin desc, buy terminal asc,
// sell terminal asc, commodity asc.
bool routeBefore(const RankedRoute& a, const RankedRoute& b);

// Desirability score:
//   70 * profit / bestProfit
// + 20 * min(margin, 200) / 200
// + 10 if both terminals are monitored, 5 if one is.
double scoreRoute(const RankedRoute& r, double bestProfit);

// Scores each leg at its usable quantity, keeps strictly positive profit,
// ranks and returns at most `count` routes (count == 0 returns none but still
// reports totalProfitable).
//
// The snapshot is only used for terminal monitoring flags.
OptimizeResult optimizeRoutes(const std::vector<CandidateLeg>& legs,
                              const market::MarketSnapshot& snapshot,
                              std::size_t count);

} // namespace tradelane::trade
