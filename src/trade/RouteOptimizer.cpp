#include "tradelane/trade/RouteOptimizer.h"

#include <algorithm>
#include <utility>

namespace tradelane::trade {

bool routeBefore(const RankedRoute& a, const RankedRoute& b) {
  if (a.profit.absoluteProfit != b.profit.absoluteProfit) return a.profit.absoluteProfit > b.profit.absoluteProfit;
  if (a.profit.marginPercent != b.profit.marginPercent) return a.profit.marginPercent > b.profit.marginPercent;
  if (a.leg.buyTerminal != b.leg.buyTerminal) return a.leg.buyTerminal < b.leg.buyTerminal;
  if (a.leg.sellTerminal != b.leg.sellTerminal) return a.leg.sellTerminal < b.leg.sellTerminal;
  return a.leg.commodity < b.leg.commodity;
}

double scoreRoute(const RankedRoute& r, double bestProfit) {
  double s = 0.0;
  if (bestProfit > 0.0) s += 70.0 * std::clamp(r.profit.absoluteProfit / bestProfit, 0.0, 1.0);
  s += 20.0 * std::clamp(r.profit.marginPercent, 0.0, 200.0) / 200.0;
  if (r.buyMonitored && r.sellMonitored) {
    s += 10.0;
  } else if (r.buyMonitored || r.sellMonitored) {
    s += 5.0;
  }
  return std::clamp(s, 0.0, 100.0);
}

static bool monitored(const market::MarketSnapshot& snapshot, market::TerminalId id) {
  const market::Terminal* t = snapshot.findTerminal(id);
  return t && t->isMonitored;
}

OptimizeResult optimizeRoutes(const std::vector<CandidateLeg>& legs,
                              const market::MarketSnapshot& snapshot,
                              std::size_t count) {
  OptimizeResult res;

  std::vector<RankedRoute> profitable;
  profitable.reserve(legs.size());
  for (const auto& leg : legs) {
    RankedRoute r;
    r.leg = leg;
    // Builder output always has buy > 0 and quantity >= 1; anything else is skipped.
    if (!calculateProfit(leg.buyPrice, leg.sellPrice, leg.quantity, r.profit)) continue;
    if (!(r.profit.absoluteProfit > 0.0)) continue;
    profitable.push_back(r);
  }

  res.totalProfitable = profitable.size();
  if (profitable.empty()) {
    res.status = TradeStatus::OkNoProfitableRoute;
    return res;
  }
  res.status = TradeStatus::OkWithRoutes;

  const std::size_t keep = std::min(count, profitable.size());
  std::partial_sort(profitable.begin(), profitable.begin() + (std::ptrdiff_t)keep, profitable.end(), routeBefore);
  profitable.resize(keep);

  // Best profit over all profitable candidates == first after sorting.
  const double best = keep > 0 ? profitable.front().profit.absoluteProfit : 0.0;
  for (std::size_t i = 0; i < profitable.size(); ++i) {
    RankedRoute& r = profitable[i];
    r.rank = i + 1;
    r.buyMonitored = monitored(snapshot, r.leg.buyTerminal);
    r.sellMonitored = monitored(snapshot, r.leg.sellTerminal);
    r.score = scoreRoute(r, best);
  }

  res.routes = std::move(profitable);
  return res;
}

} // namespace tradelane::trade
