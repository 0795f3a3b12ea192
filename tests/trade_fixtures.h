#pragma once

#include "tradelane/market/Catalog.h"

#include <string>
#include <utility>
#include <vector>

// Small hand-built catalogs shared by the trade tests.
namespace fixtures {

using namespace tradelane;

inline market::Terminal terminal(market::TerminalId id, std::string name, std::string system = "Stanton",
                                 std::string planet = "", std::string station = "") {
  market::Terminal t;
  t.id = id;
  t.name = std::move(name);
  t.location.system = std::move(system);
  t.location.planet = std::move(planet);
  t.location.station = std::move(station);
  return t;
}

inline market::CommodityListing listing(market::TerminalId terminal, double buy, double sell, double stock,
                                        double reportedAtSec = 0.0) {
  market::CommodityListing l;
  l.terminal = terminal;
  l.buyPrice = buy;
  l.sellPrice = sell;
  l.stockScu = stock;
  l.reportedAtSec = reportedAtSec;
  return l;
}

inline market::Commodity commodity(market::CommodityId id, std::string code, std::string name,
                                   std::vector<market::CommodityListing> listings, bool legal = true) {
  market::Commodity c;
  c.id = id;
  c.code = std::move(code);
  c.name = std::move(name);
  c.legal = legal;
  c.listings = std::move(listings);
  return c;
}

// Two terminals, one commodity: buy 10 at A (stock 200), sell 25 at B.
inline market::MarketSnapshot simpleMarket() {
  std::vector<market::Terminal> ts{
    terminal(1, "Area18 TDD", "Stanton", "ArcCorp", "Area18"),
    terminal(2, "Lorville CBD", "Stanton", "Hurston", "Lorville"),
  };
  std::vector<market::Commodity> cs{
    commodity(10, "AGRI", "Agricium", {listing(1, 10.0, 0.0, 200.0), listing(2, 0.0, 25.0, 0.0)}),
  };
  return market::MarketSnapshot(std::move(cs), std::move(ts), 0.0);
}

// Three terminals and four commodities, one of them illegal.
inline market::MarketSnapshot mixedMarket() {
  std::vector<market::Terminal> ts{
    terminal(1, "Port Olisar Admin", "Stanton", "Crusader", "Port Olisar"),
    terminal(2, "Lorville CBD", "Stanton", "Hurston", "Lorville"),
    terminal(3, "Grim HEX", "Stanton", "Crusader", "Grim HEX"),
  };
  ts[0].isMonitored = true;
  ts[1].isMonitored = true;

  std::vector<market::Commodity> cs{
    commodity(1, "LARA", "Laranite",
              {listing(1, 28.0, 0.0, 500.0), listing(2, 0.0, 31.0, 0.0), listing(3, 0.0, 30.0, 0.0)}),
    commodity(2, "TITA", "Titanium",
              {listing(1, 8.0, 0.0, 1000.0), listing(2, 0.0, 9.0, 0.0), listing(3, 0.0, 7.0, 0.0)}),
    commodity(3, "WIDO", "WiDoW",
              {listing(3, 20.0, 0.0, 1000.0), listing(1, 0.0, 90.0, 0.0)}, false),
    commodity(4, "MEDS", "Medical Supplies",
              {listing(2, 15.0, 0.0, 300.0), listing(1, 0.0, 17.0, 0.0), listing(3, 0.0, 20.0, 0.0)}),
  };
  return market::MarketSnapshot(std::move(cs), std::move(ts), 0.0);
}

} // namespace fixtures
