#include "tradelane/trade/TradeConfig.h"

#include "tradelane/core/CVar.h"
#include "test_harness.h"

#include <string>

int test_trade_config() {
  int failures = 0;

  using namespace tradelane;
  namespace opt = trade::option;

  // ---- Defaults ----
  {
    core::CVarRegistry reg;
    CHECK(trade::registerTradeCVars(reg));
    CHECK(reg.exists(opt::kToolCommodityRoute));
    CHECK(reg.exists(opt::kListLimit));

    trade::TradeConfig c;
    CHECK(trade::loadTradeConfig(reg, c));
    CHECK(c.toolCommodityRoute);
    CHECK(c.toolProfitCalculation);
    CHECK(c.routeDefaultCount == 1);
    CHECK(c.useEstimatedAvailability);
    CHECK(!c.advancedInfo);
    CHECK(c.listLimit == 5);
    CHECK(c.replenishScuPerHour == 40.0);
    CHECK(c.workerThreads == 0);
    CHECK(c.logLevel == "info");
  }

  // ---- Overrides ----
  {
    core::CVarRegistry reg;
    CHECK(trade::registerTradeCVars(reg));
    CHECK(reg.setFromString(opt::kRouteDefaultCount, "3"));
    CHECK(reg.setFromString(opt::kRouteAdvancedInfo, "true"));
    CHECK(reg.setFromString(opt::kToolProfitCalculation, "off"));
    CHECK(reg.setFromString(opt::kReplenishScuPerHour, "12.5"));
    CHECK(reg.setFromString(opt::kLogLevel, "debug"));

    trade::TradeConfig c;
    CHECK(trade::loadTradeConfig(reg, c));
    CHECK(c.routeDefaultCount == 3);
    CHECK(c.advancedInfo);
    CHECK(!c.toolProfitCalculation);
    CHECK(c.replenishScuPerHour == 12.5);
    CHECK(c.logLevel == "debug");
  }

  // ---- Range checks; output untouched on failure ----
  {
    auto rejects = [](const char* name, const char* value) {
      core::CVarRegistry reg;
      if (!trade::registerTradeCVars(reg)) return false;
      if (!reg.setFromString(name, value)) return false;
      trade::TradeConfig c;
      c.listLimit = 77;
      std::string err;
      return !trade::loadTradeConfig(reg, c, &err) && !err.empty() && c.listLimit == 77;
    };
    CHECK(rejects(opt::kRouteDefaultCount, "0"));
    CHECK(rejects(opt::kListLimit, "-1"));
    CHECK(rejects(opt::kReplenishScuPerHour, "-3"));
    CHECK(rejects(opt::kWorkerThreads, "-2"));
    CHECK(rejects(opt::kLogLevel, "chatty"));
  }

  // ---- Registering twice is harmless; a type clash is reported ----
  {
    core::CVarRegistry reg;
    CHECK(trade::registerTradeCVars(reg));
    CHECK(trade::registerTradeCVars(reg));

    core::CVarRegistry clash;
    clash.defineString(opt::kListLimit, "five");
    CHECK(!trade::registerTradeCVars(clash));
  }

  return failures;
}
