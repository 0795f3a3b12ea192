#include "tradelane/trade/AvailabilityEstimator.h"

#include "test_harness.h"

#include <cmath>

int test_availability() {
  int failures = 0;

  using namespace tradelane;
  using trade::AvailabilityParams;
  using trade::estimateAvailability;
  using trade::estimateStockScu;

  auto near = [](double a, double b) { return std::fabs(a - b) < 1e-6; };

  market::CommodityListing l;
  l.terminal = 1;
  l.buyPrice = 10.0;
  l.stockScu = 100.0;
  l.reportedAtSec = 0.0;
  l.stockCeilingScu = 1000.0;
  l.equilibriumScu = 600.0;
  l.replenishScuPerHour = 50.0;

  // ---- Disabled -> raw ----
  {
    AvailabilityParams p;
    p.useEstimated = false;
    p.nowSec = 10.0 * 3600.0;
    const auto e = estimateAvailability(l, p);
    CHECK(!e.estimated);
    CHECK(near(e.estimatedScu, 100.0));
    CHECK(near(e.rawScu, 100.0));
    CHECK(near(e.ageHours, 10.0));
  }

  // ---- Zero elapsed equals the report ----
  {
    AvailabilityParams p;
    p.nowSec = 0.0;
    CHECK(near(estimateStockScu(l, p), 100.0));
  }

  // ---- Report stamped in the future is treated as fresh ----
  {
    AvailabilityParams p;
    p.nowSec = -3600.0;
    const auto e = estimateAvailability(l, p);
    CHECK(near(e.ageHours, 0.0));
    CHECK(near(e.estimatedScu, 100.0));
  }

  // ---- Linear recovery toward equilibrium ----
  {
    AvailabilityParams p;
    p.nowSec = 2.0 * 3600.0;
    CHECK(near(estimateStockScu(l, p), 200.0));

    p.nowSec = 100.0 * 3600.0;
    CHECK(near(estimateStockScu(l, p), 600.0)); // stops at equilibrium
  }

  // ---- Decay toward a lower equilibrium ----
  {
    market::CommodityListing hi = l;
    hi.stockScu = 900.0;
    hi.equilibriumScu = 300.0;
    AvailabilityParams p;
    p.nowSec = 4.0 * 3600.0;
    CHECK(near(estimateStockScu(hi, p), 700.0));
    p.nowSec = 1000.0 * 3600.0;
    CHECK(near(estimateStockScu(hi, p), 300.0));
  }

  // ---- Never exceeds a known ceiling ----
  {
    market::CommodityListing c = l;
    c.stockCeilingScu = 150.0;
    c.equilibriumScu = 5000.0;
    AvailabilityParams p;
    p.nowSec = 1000.0 * 3600.0;
    CHECK(estimateStockScu(c, p) <= 150.0 + 1e-9);
    CHECK(near(estimateStockScu(c, p), 150.0));
  }

  // ---- Without a ceiling, never exceeds the last report ----
  {
    market::CommodityListing c = l;
    c.stockCeilingScu = 0.0;
    c.equilibriumScu = 5000.0;
    AvailabilityParams p;
    p.nowSec = 1000.0 * 3600.0;
    CHECK(estimateStockScu(c, p) <= 100.0 + 1e-9);
  }

  // ---- Unknown equilibrium holds the report; configured default rate applies ----
  {
    market::CommodityListing c = l;
    c.equilibriumScu = -1.0;
    AvailabilityParams p;
    p.nowSec = 50.0 * 3600.0;
    CHECK(near(estimateStockScu(c, p), 100.0));

    c.equilibriumScu = 600.0;
    c.replenishScuPerHour = -1.0;
    p.defaultReplenishScuPerHour = 10.0;
    p.nowSec = 3.0 * 3600.0;
    CHECK(near(estimateStockScu(c, p), 130.0));
  }

  // ---- Ceiling below the report binds once time has elapsed ----
  {
    market::CommodityListing c = l;
    c.stockScu = 300.0;
    c.stockCeilingScu = 100.0;
    c.equilibriumScu = 50.0;
    c.replenishScuPerHour = 10.0;
    AvailabilityParams p;
    p.nowSec = 0.0;
    CHECK(near(estimateStockScu(c, p), 300.0));
    p.nowSec = 5.0 * 3600.0;
    CHECK(near(estimateStockScu(c, p), 100.0));
    p.nowSec = 30.0 * 3600.0;
    CHECK(near(estimateStockScu(c, p), 50.0));
  }

  // ---- Non-negative ----
  {
    market::CommodityListing c = l;
    c.stockScu = 0.0;
    c.equilibriumScu = 0.0;
    AvailabilityParams p;
    p.nowSec = 5.0 * 3600.0;
    CHECK(estimateStockScu(c, p) >= 0.0);
  }

  return failures;
}
