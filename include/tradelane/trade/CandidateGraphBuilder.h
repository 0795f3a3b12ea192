#pragma once

#include "tradelane/market/Catalog.h"
#include "tradelane/trade/AvailabilityEstimator.h"
#include "tradelane/trade/Ship.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tradelane::core { class JobSystem; }

namespace tradelane::trade {

struct CandidateParams {
  Ship ship{};
  double budget{0.0};

  // Restricts buy terminals to those matching this location (terminal,
  // station, planet or system name). Empty = anywhere.
  std::string location;

  bool commodityFilterEnabled{false};
  market::CommodityId commodityFilter{0};

  AvailabilityParams availability{};
};

// One feasible buy -> sell leg. Not yet scored; may be unprofitable.
struct CandidateLeg {
  market::CommodityId commodity{0};
  market::TerminalId buyTerminal{0};
  market::TerminalId sellTerminal{0};

  double buyPrice{0.0};
  double sellPrice{0.0};

  // Buy side stock.
  double rawStockScu{0.0};
  double estimatedStockScu{0.0};
  double reportAgeHours{0.0};

  // Sell side demand as reported (informational).
  double sellDemandScu{0.0};

  // Whole SCU: min(cargo, floor(estimated stock), floor(budget / buyPrice)), >= 1.
  double quantity{0.0};
};

struct CandidateBuildStats {
  std::size_t commoditiesScanned{0};
  std::size_t illegalCommoditiesSkipped{0};
  std::size_t legalityRejections{0}; // listings dropped by checkLeg() (either side)
  std::size_t quantityRejections{0}; // buy listings with a usable quantity below 1
  std::size_t legs{0};
};

// Pairs every buy-eligible listing with every sell-eligible listing of the
// same commodity at a different terminal.
//
// Output order: commodity id, buy terminal id, sell terminal id (ascending).
std::vector<CandidateLeg> buildCandidateLegs(const market::MarketSnapshot& snapshot,
                                             const CandidateParams& params,
                                             CandidateBuildStats* outStats = nullptr);

// Parallel variant: one task per commodity, each writing its own bucket.
// Buckets are merged in commodity order, so the result (legs and stats) is
// identical to buildCandidateLegs().
std::vector<CandidateLeg> buildCandidateLegsParallel(core::JobSystem& jobs,
                                                     const market::MarketSnapshot& snapshot,
                                                     const CandidateParams& params,
                                                     CandidateBuildStats* outStats = nullptr);

} // namespace tradelane::trade
