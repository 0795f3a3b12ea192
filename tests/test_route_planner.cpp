#include "tradelane/trade/RoutePlanner.h"

#include "tradelane/core/JobSystem.h"
#include "tradelane/core/Log.h"
#include "test_harness.h"
#include "trade_fixtures.h"

#include <cmath>
#include <limits>

int test_route_planner() {
  int failures = 0;

  using namespace tradelane;
  using trade::TradeStatus;

  const core::LogLevel prevLevel = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Off);

  auto simpleQuery = []() {
    trade::TradeConstraints q;
    q.ship.cargoScu = 100.0;
    q.budget = 500000.0;
    return q;
  };

  const trade::TradeConfig config{};

  // ---- 100 SCU, budget 500k, buy 10 / sell 25, stock 200 ----
  {
    const auto snap = fixtures::simpleMarket();
    auto q = simpleQuery();
    q.advancedInfo = true;
    const auto rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.status == TradeStatus::OkWithRoutes);
    CHECK(rep.routes.size() == 1);
    CHECK(rep.totalAvailable == 1);
    if (!rep.routes.empty()) {
      CHECK(rep.routes[0].quantity == 100.0);
      CHECK(std::fabs(rep.routes[0].absoluteProfit - 1500.0) < 1e-9);
      CHECK(std::fabs(rep.routes[0].marginPercent - 150.0) < 1e-9);
      CHECK(rep.routes[0].marginText == "150%");
      CHECK(rep.routes[0].commodity == "Agricium");
    }
  }

  // ---- All non-positive margins ----
  {
    std::vector<market::Terminal> ts{fixtures::terminal(1, "A"), fixtures::terminal(2, "B")};
    std::vector<market::Commodity> cs{
      fixtures::commodity(1, "X", "X", {fixtures::listing(1, 10.0, 0.0, 100.0), fixtures::listing(2, 0.0, 10.0, 0.0)}),
      fixtures::commodity(2, "Y", "Y", {fixtures::listing(2, 10.0, 0.0, 100.0), fixtures::listing(1, 0.0, 4.0, 0.0)}),
    };
    const market::MarketSnapshot snap(std::move(cs), std::move(ts));
    const auto rep = trade::planTradeRoutes(snap, simpleQuery(), config);
    CHECK(rep.status == TradeStatus::OkNoProfitableRoute);
    CHECK(rep.routes.empty());
    CHECK(rep.totalAvailable == 0);
  }

  // ---- Illegal commodity never appears ----
  {
    const auto snap = fixtures::mixedMarket();
    auto q = simpleQuery();
    q.count = 50;
    const auto rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.status == TradeStatus::OkWithRoutes);
    CHECK(rep.totalAvailable == 5);
    for (const auto& r : rep.routes) CHECK(r.commodity != "WiDoW");
  }

  // ---- Default count and list limit ----
  {
    const auto snap = fixtures::mixedMarket();
    auto rep = trade::planTradeRoutes(snap, simpleQuery(), config);
    CHECK(rep.routes.size() == 1);
    CHECK(rep.totalAvailable == 5);
    CHECK(rep.truncated);
    CHECK(!rep.notices.empty());

    trade::TradeConfig many = config;
    many.routeDefaultCount = 20;
    many.listLimit = 3;
    rep = trade::planTradeRoutes(snap, simpleQuery(), many);
    CHECK(rep.routes.size() == 3);

    auto q = simpleQuery();
    q.count = 4; // explicit request beats the list limit
    rep = trade::planTradeRoutes(snap, q, many);
    CHECK(rep.routes.size() == 4);

    CHECK(trade::resolveRouteLimit(simpleQuery(), config) == 1);
    CHECK(trade::resolveRouteLimit(q, config) == 4);
  }

  // ---- Invalid input ----
  {
    const auto snap = fixtures::simpleMarket();

    auto q = simpleQuery();
    q.budget = 0.0;
    CHECK(trade::planTradeRoutes(snap, q, config).status == TradeStatus::InvalidInput);

    q = simpleQuery();
    q.budget = std::numeric_limits<double>::quiet_NaN();
    CHECK(trade::planTradeRoutes(snap, q, config).status == TradeStatus::InvalidInput);

    q = simpleQuery();
    q.ship.cargoScu = -5.0;
    CHECK(trade::planTradeRoutes(snap, q, config).status == TradeStatus::InvalidInput);

    q = simpleQuery();
    q.location = "Nyx";
    const auto rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.status == TradeStatus::InvalidInput);
    CHECK(rep.message.find("Nyx") != std::string::npos);

    q = simpleQuery();
    q.commodity = "Unobtainium";
    CHECK(trade::planTradeRoutes(snap, q, config).status == TradeStatus::InvalidInput);
  }

  // ---- No catalog data is not the same as no route ----
  {
    const market::MarketSnapshot empty;
    const auto rep = trade::planTradeRoutes(empty, simpleQuery(), config);
    CHECK(rep.status == TradeStatus::NoCatalogData);
  }

  // ---- Tool toggle ----
  {
    trade::TradeConfig off = config;
    off.toolCommodityRoute = false;
    CHECK(trade::planTradeRoutes(fixtures::simpleMarket(), simpleQuery(), off).status == TradeStatus::ToolDisabled);
  }

  // ---- Commodity filter by code or name; location restricts buying ----
  {
    const auto snap = fixtures::mixedMarket();
    auto q = simpleQuery();
    q.count = 10;
    q.commodity = "lara";
    auto rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.totalAvailable == 2);
    for (const auto& r : rep.routes) CHECK(r.commodityCode == "LARA");

    q.commodity = "Medical Supplies";
    rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.totalAvailable == 2);

    q.commodity.clear();
    q.location = "Hurston";
    rep = trade::planTradeRoutes(snap, q, config);
    CHECK(rep.totalAvailable == 2);
    for (const auto& r : rep.routes) CHECK(r.buyTerminal == "Lorville CBD");
  }

  // ---- Parallel path gives the same report ----
  {
    const auto snap = fixtures::mixedMarket();
    auto q = simpleQuery();
    q.count = 10;
    core::JobSystem jobs(3);
    trade::CandidateBuildStats stats;
    const auto a = trade::planTradeRoutes(snap, q, config);
    const auto b = trade::planTradeRoutes(snap, q, config, &jobs, &stats);
    CHECK(a.routes.size() == b.routes.size());
    for (std::size_t i = 0; i < a.routes.size() && i < b.routes.size(); ++i) {
      CHECK(a.routes[i].commodity == b.routes[i].commodity);
      CHECK(a.routes[i].buyTerminal == b.routes[i].buyTerminal);
      CHECK(a.routes[i].sellTerminal == b.routes[i].sellTerminal);
      CHECK(a.routes[i].absoluteProfit == b.routes[i].absoluteProfit);
    }
    CHECK(stats.illegalCommoditiesSkipped == 1);
    CHECK(stats.legs == 6);
  }

  // ---- Estimated availability override ----
  {
    std::vector<market::Terminal> ts{fixtures::terminal(1, "A"), fixtures::terminal(2, "B")};
    auto buy = fixtures::listing(1, 10.0, 0.0, 10.0, 0.0);
    buy.stockCeilingScu = 1000.0;
    buy.equilibriumScu = 900.0;
    std::vector<market::Commodity> cs{fixtures::commodity(1, "X", "X", {buy, fixtures::listing(2, 0.0, 20.0, 0.0)})};
    const market::MarketSnapshot snap(std::move(cs), std::move(ts));

    auto q = simpleQuery();
    q.nowSec = 1.0 * 3600.0;

    auto rep = trade::planTradeRoutes(snap, q, config); // default rate 40 SCU/h
    CHECK(!rep.routes.empty() && rep.routes[0].quantity == 50.0);

    q.useEstimatedAvailability = false;
    rep = trade::planTradeRoutes(snap, q, config);
    CHECK(!rep.routes.empty() && rep.routes[0].quantity == 10.0);
  }

  // ---- Profit tool ----
  {
    auto rep = trade::runProfitTool(config, 10.0, 25.0, 100.0);
    CHECK(rep.status == TradeStatus::OkWithRoutes);
    CHECK(std::fabs(rep.figures.absoluteProfit - 1500.0) < 1e-9);
    CHECK(rep.marginText == "150%");

    rep = trade::runProfitTool(config, 20.0, 15.0);
    CHECK(isOk(rep.status));
    CHECK(!rep.hasQuantity);
    CHECK(rep.baseProfitText == "minus 25%");

    rep = trade::runProfitTool(config, 1e-78, 1.0);
    CHECK(isOk(rep.status));
    CHECK(rep.baseProfitText.size() > 70 && rep.baseProfitText.back() == '%');

    rep = trade::runProfitTool(config, 0.0, 15.0, 3.0);
    CHECK(rep.status == TradeStatus::InvalidInput);
    CHECK(!rep.message.empty());

    rep = trade::runProfitTool(config, 10.0, 15.0, 0.0);
    CHECK(rep.status == TradeStatus::InvalidInput);

    trade::TradeConfig off = config;
    off.toolProfitCalculation = false;
    CHECK(trade::runProfitTool(off, 10.0, 15.0).status == TradeStatus::ToolDisabled);
  }

  core::setLogLevel(prevLevel);
  return failures;
}
