#include "tradelane/trade/CandidateGraphBuilder.h"

#include "tradelane/core/JobSystem.h"
#include "tradelane/trade/LegalityFilter.h"

#include <algorithm>
#include <cmath>

namespace tradelane::trade {

namespace {

struct Bucket {
  std::vector<CandidateLeg> legs;
  CandidateBuildStats stats;
};

bool commodityWanted(const market::Commodity& c, const CandidateParams& p) {
  return !p.commodityFilterEnabled || c.id == p.commodityFilter;
}

double usableQuantity(const market::CommodityListing& buy, double estimatedStock, const CandidateParams& p) {
  if (!(buy.buyPrice > 0.0) || !std::isfinite(p.budget) || !std::isfinite(p.ship.cargoScu)) return 0.0;

  const double byCargo = std::floor(std::max(0.0, p.ship.cargoScu));
  const double byStock = std::floor(std::max(0.0, estimatedStock));
  double byBudget = std::floor(std::max(0.0, p.budget) / buy.buyPrice);

  // floor(budget / price) can land one unit high through rounding.
  if (byBudget > 0.0 && byBudget * buy.buyPrice > p.budget) byBudget -= 1.0;

  return std::min({byCargo, byStock, byBudget});
}

void buildForCommodity(const market::MarketSnapshot& snapshot,
                       const market::Commodity& c,
                       const CandidateParams& p,
                       Bucket& out) {
  out.stats.commoditiesScanned = 1;

  if (!c.legal) {
    out.stats.illegalCommoditiesSkipped = 1;
    return;
  }

  // Per-commodity cache of sell-eligible listings.
  std::vector<const market::CommodityListing*> sells;
  sells.reserve(c.listings.size());
  for (const auto& l : c.listings) {
    if (!l.sellable()) continue;
    const market::Terminal* t = snapshot.findTerminal(l.terminal);
    if (!t) continue;
    if (!legAllowed(c, LegSide::Sell, p.ship, *t)) {
      ++out.stats.legalityRejections;
      continue;
    }
    sells.push_back(&l);
  }

  for (const auto& buy : c.listings) {
    if (!buy.buyable()) continue;
    const market::Terminal* t = snapshot.findTerminal(buy.terminal);
    if (!t) continue;
    if (!market::MarketSnapshot::terminalMatchesLocation(*t, p.location)) continue;
    if (!legAllowed(c, LegSide::Buy, p.ship, *t)) {
      ++out.stats.legalityRejections;
      continue;
    }

    const AvailabilityEstimate avail = estimateAvailability(buy, p.availability);
    const double qty = usableQuantity(buy, avail.estimatedScu, p);
    if (qty < 1.0) {
      ++out.stats.quantityRejections;
      continue;
    }

    for (const market::CommodityListing* sell : sells) {
      if (sell->terminal == buy.terminal) continue;

      CandidateLeg leg;
      leg.commodity = c.id;
      leg.buyTerminal = buy.terminal;
      leg.sellTerminal = sell->terminal;
      leg.buyPrice = buy.buyPrice;
      leg.sellPrice = sell->sellPrice;
      leg.rawStockScu = avail.rawScu;
      leg.estimatedStockScu = avail.estimatedScu;
      leg.reportAgeHours = avail.ageHours;
      leg.sellDemandScu = sell->demandScu;
      leg.quantity = qty;
      out.legs.push_back(leg);
    }
  }

  out.stats.legs = out.legs.size();
}

void accumulate(CandidateBuildStats& into, const CandidateBuildStats& s) {
  into.commoditiesScanned += s.commoditiesScanned;
  into.illegalCommoditiesSkipped += s.illegalCommoditiesSkipped;
  into.legalityRejections += s.legalityRejections;
  into.quantityRejections += s.quantityRejections;
  into.legs += s.legs;
}

} // namespace

std::vector<CandidateLeg> buildCandidateLegs(const market::MarketSnapshot& snapshot,
                                             const CandidateParams& params,
                                             CandidateBuildStats* outStats) {
  std::vector<CandidateLeg> legs;
  CandidateBuildStats stats;

  for (const auto& c : snapshot.commodities()) {
    if (!commodityWanted(c, params)) continue;
    Bucket b;
    buildForCommodity(snapshot, c, params, b);
    accumulate(stats, b.stats);
    legs.insert(legs.end(), b.legs.begin(), b.legs.end());
  }

  if (outStats) *outStats = stats;
  return legs;
}

std::vector<CandidateLeg> buildCandidateLegsParallel(core::JobSystem& jobs,
                                                     const market::MarketSnapshot& snapshot,
                                                     const CandidateParams& params,
                                                     CandidateBuildStats* outStats) {
  std::vector<const market::Commodity*> work;
  work.reserve(snapshot.commodities().size());
  for (const auto& c : snapshot.commodities()) {
    if (commodityWanted(c, params)) work.push_back(&c);
  }

  std::vector<Bucket> buckets = jobs.parallelCollect(work.size(), [&](std::size_t i) {
    Bucket b;
    buildForCommodity(snapshot, *work[i], params, b);
    return b;
  });

  std::size_t total = 0;
  for (const auto& b : buckets) total += b.legs.size();

  std::vector<CandidateLeg> legs;
  legs.reserve(total);
  CandidateBuildStats stats;
  for (auto& b : buckets) {
    accumulate(stats, b.stats);
    legs.insert(legs.end(), b.legs.begin(), b.legs.end());
  }

  if (outStats) *outStats = stats;
  return legs;
}

} // namespace tradelane::trade
