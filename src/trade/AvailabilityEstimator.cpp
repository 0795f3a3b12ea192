#include "tradelane/trade/AvailabilityEstimator.h"

#include <algorithm>
#include <cmath>

namespace tradelane::trade {

static double finiteOr(double v, double fallback) {
  return std::isfinite(v) ? v : fallback;
}

AvailabilityEstimate estimateAvailability(const market::CommodityListing& listing,
                                          const AvailabilityParams& params) {
  AvailabilityEstimate e;
  e.rawScu = finiteOr(listing.stockScu, 0.0);
  e.estimatedScu = e.rawScu;

  const double ageSec = finiteOr(params.nowSec, 0.0) - finiteOr(listing.reportedAtSec, 0.0);
  e.ageHours = std::max(0.0, ageSec / 3600.0);

  if (!params.useEstimated) return e;
  e.estimated = true;

  const double reported = std::max(0.0, e.rawScu);
  const double ceiling = finiteOr(listing.stockCeilingScu, 0.0);
  if (e.ageHours <= 0.0) {
    e.estimatedScu = reported;
    return e;
  }

  // A known ceiling binds even when the last report sits above it.
  const double upper = (ceiling > 0.0) ? ceiling : reported;

  const double eq = finiteOr(listing.equilibriumScu, -1.0);
  const double target = (eq >= 0.0) ? std::clamp(eq, 0.0, upper) : reported;

  double rate = finiteOr(listing.replenishScuPerHour, -1.0);
  if (rate < 0.0) rate = finiteOr(params.defaultReplenishScuPerHour, 0.0);
  rate = std::max(0.0, rate);

  const double gap = target - reported;
  const double step = std::min(std::fabs(gap), rate * e.ageHours);
  const double est = reported + (gap >= 0.0 ? step : -step);

  e.estimatedScu = std::clamp(est, 0.0, upper);
  return e;
}

double estimateStockScu(const market::CommodityListing& listing, const AvailabilityParams& params) {
  return estimateAvailability(listing, params).estimatedScu;
}

} // namespace tradelane::trade
