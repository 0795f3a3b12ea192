#pragma once

#include "tradelane/market/Catalog.h"

namespace tradelane::trade {

struct AvailabilityParams {
  // If false, the raw report is returned unmodified.
  bool useEstimated{true};

  // Query time, same clock as CommodityListing::reportedAtSec.
  double nowSec{0.0};

  // Used when a listing has no replenish rate of its own.
  double defaultReplenishScuPerHour{40.0};
};

struct AvailabilityEstimate {
  double rawScu{0.0};
  double estimatedScu{0.0};
  double ageHours{0.0};   // 0 for reports stamped at or after nowSec
  bool estimated{false};  // false when the raw report was used as-is
};

// Projects the last stock report at a terminal to query time.
//
// Stock moves linearly toward the listing's equilibrium (or stays at the
// report when no equilibrium is known) at the replenish rate, and is clamped
// to [0, ceiling] when a ceiling is known, else to [0, reported]:
//
//   est = reported + sign(target - reported) * min(|target - reported|, rate * ageHours)
//
// Guarantees: est >= 0; est == reported when ageHours == 0; once time has
// elapsed est never exceeds a known ceiling (even one below the report), and
// without a ceiling est never exceeds the last report.
AvailabilityEstimate estimateAvailability(const market::CommodityListing& listing,
                                          const AvailabilityParams& params);

// Convenience: estimateAvailability(...).estimatedScu
double estimateStockScu(const market::CommodityListing& listing, const AvailabilityParams& params);

} // namespace tradelane::trade
