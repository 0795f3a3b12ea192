#include "tradelane/trade/ProfitCalculator.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <string>

int test_profit_calculator() {
  int failures = 0;

  using namespace tradelane::trade;

  auto near = [](double a, double b) { return std::fabs(a - b) < 1e-9; };

  // ---- Basic figures ----
  {
    ProfitFigures f;
    CHECK(calculateProfit(10.0, 25.0, 100.0, f));
    CHECK(near(f.profitPerUnit, 15.0));
    CHECK(near(f.absoluteProfit, 1500.0));
    CHECK(near(f.marginPercent, 150.0));
    CHECK(near(f.baseProfitPercent, 150.0));
    CHECK(near(f.quantity, 100.0));
  }

  // ---- Losses are valid ----
  {
    ProfitFigures f;
    CHECK(calculateProfit(20.0, 15.0, 10.0, f));
    CHECK(near(f.absoluteProfit, -50.0));
    CHECK(near(f.marginPercent, -25.0));
  }

  // ---- Invalid input leaves output untouched ----
  {
    ProfitFigures f;
    f.absoluteProfit = 123.0;
    std::string err;
    CHECK(!calculateProfit(0.0, 25.0, 10.0, f, &err));
    CHECK(!err.empty());
    CHECK(!calculateProfit(-1.0, 25.0, 10.0, f));
    CHECK(!calculateProfit(10.0, 25.0, 0.0, f));
    CHECK(!calculateProfit(10.0, 25.0, -3.0, f));
    CHECK(!calculateProfit(10.0, std::numeric_limits<double>::quiet_NaN(), 1.0, f));
    CHECK(!calculateProfit(10.0, 25.0, std::numeric_limits<double>::infinity(), f));
    CHECK(near(f.absoluteProfit, 123.0));
  }

  // ---- Base profit without quantity ----
  {
    double pct = 0.0;
    CHECK(baseProfitPercent(8.0, 10.0, pct));
    CHECK(near(pct, 25.0));
    CHECK(!baseProfitPercent(0.0, 10.0, pct));
  }

  return failures;
}
