#include "tradelane/trade/RouteResultShaper.h"

#include "tradelane/core/JsonWriter.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace tradelane::trade {

std::string formatPercent(double percent) {
  if (!std::isfinite(percent)) return "n/a";

  double v = std::round(percent * 10.0) / 10.0;
  const bool negative = v < 0.0;
  v = std::fabs(v);

  std::ostringstream os;
  if (negative) os << "minus ";
  os << std::fixed << std::setprecision(v == std::floor(v) ? 0 : 1) << v << '%';
  return os.str();
}

static std::string terminalName(const market::MarketSnapshot& snapshot, market::TerminalId id) {
  const market::Terminal* t = snapshot.findTerminal(id);
  return t ? t->name : ("terminal " + std::to_string(id));
}

static std::string terminalPath(const market::MarketSnapshot& snapshot, market::TerminalId id) {
  const market::Terminal* t = snapshot.findTerminal(id);
  return t ? t->location.path() : std::string();
}

static ShapedRoute shapeRoute(const RankedRoute& r, const market::MarketSnapshot& snapshot, bool advanced) {
  ShapedRoute s;
  s.rank = r.rank;
  s.buyTerminal = terminalName(snapshot, r.leg.buyTerminal);
  s.sellTerminal = terminalName(snapshot, r.leg.sellTerminal);
  s.buyPrice = r.leg.buyPrice;
  s.sellPrice = r.leg.sellPrice;
  s.quantity = r.leg.quantity;
  s.absoluteProfit = r.profit.absoluteProfit;

  market::InventoryStatus buyStatus = market::InventoryStatus::Unknown;
  market::InventoryStatus sellStatus = market::InventoryStatus::Unknown;
  if (const market::Commodity* c = snapshot.findCommodity(r.leg.commodity)) {
    s.commodity = c->name;
    s.commodityCode = c->code;
    if (const auto* l = c->listingAt(r.leg.buyTerminal)) buyStatus = l->buyStatus;
    if (const auto* l = c->listingAt(r.leg.sellTerminal)) sellStatus = l->sellStatus;
  } else {
    s.commodity = "commodity " + std::to_string(r.leg.commodity);
  }
  s.buyInventory = std::string(market::inventoryStatusName(buyStatus));
  s.sellInventory = std::string(market::inventoryStatusName(sellStatus));

  if (advanced) {
    s.marginPercent = r.profit.marginPercent;
    s.baseProfitPercent = r.profit.baseProfitPercent;
    s.marginText = formatPercent(s.marginPercent);
    s.baseProfitText = formatPercent(s.baseProfitPercent);
    s.buyMonitored = r.buyMonitored;
    s.sellMonitored = r.sellMonitored;
    s.score = r.score;
    s.buyLocation = terminalPath(snapshot, r.leg.buyTerminal);
    s.sellLocation = terminalPath(snapshot, r.leg.sellTerminal);
    s.rawStockScu = r.leg.rawStockScu;
    s.estimatedStockScu = r.leg.estimatedStockScu;
    s.reportAgeHours = r.leg.reportAgeHours;
  }
  return s;
}

RouteReport shapeRouteReport(const OptimizeResult& result,
                             const market::MarketSnapshot& snapshot,
                             const ShapeOptions& options) {
  RouteReport rep;
  rep.status = result.status;
  rep.advancedInfo = options.advancedInfo;
  rep.totalAvailable = std::max(result.totalProfitable, result.routes.size());

  const std::size_t n = std::min(options.limit, result.routes.size());
  rep.routes.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    rep.routes.push_back(shapeRoute(result.routes[i], snapshot, options.advancedInfo));
  }

  if (result.status == TradeStatus::OkNoProfitableRoute || rep.totalAvailable == 0) {
    rep.status = TradeStatus::OkNoProfitableRoute;
    rep.routes.clear();
    rep.totalAvailable = 0;
    rep.message = "No profitable route found for the given ship, budget and location.";
    return rep;
  }

  std::ostringstream msg;
  msg << "Found " << rep.totalAvailable << " profitable route" << (rep.totalAvailable == 1 ? "" : "s") << ".";
  rep.message = msg.str();

  rep.truncated = rep.routes.size() < rep.totalAvailable;
  if (rep.truncated) {
    std::ostringstream oss;
    oss << "Important information for user: only " << rep.routes.size() << " of " << rep.totalAvailable
        << " profitable routes are shown. Ask for more routes to see the rest.";
    rep.notices.push_back(oss.str());
  }
  return rep;
}

RouteReport makeStatusReport(TradeStatus status, std::string message) {
  RouteReport rep;
  rep.status = status;
  rep.message = std::move(message);
  return rep;
}

void writeRouteReportJson(core::JsonWriter& w, const RouteReport& report) {
  w.beginObject();
  w.key("status");
  w.value(toString(report.status));
  w.key("message");
  w.value(report.message);
  w.key("total_available");
  w.value((unsigned long long)report.totalAvailable);
  w.key("truncated");
  w.value(report.truncated);

  w.key("routes");
  w.beginArray();
  for (const auto& r : report.routes) {
    w.beginObject();
    w.key("rank");
    w.value((unsigned long long)r.rank);
    w.key("commodity");
    w.value(r.commodity);
    w.key("commodity_code");
    w.value(r.commodityCode);
    w.key("buy_terminal");
    w.value(r.buyTerminal);
    w.key("sell_terminal");
    w.value(r.sellTerminal);
    w.key("buy_price");
    w.value(r.buyPrice);
    w.key("sell_price");
    w.value(r.sellPrice);
    w.key("quantity_scu");
    w.value(r.quantity);
    w.key("profit");
    w.value(r.absoluteProfit);
    w.key("buy_inventory");
    w.value(r.buyInventory);
    w.key("sell_inventory");
    w.value(r.sellInventory);

    if (report.advancedInfo) {
      w.key("margin_percent");
      w.value(r.marginPercent);
      w.key("margin");
      w.value(r.marginText);
      w.key("base_profit_percent");
      w.value(r.baseProfitPercent);
      w.key("base_profit");
      w.value(r.baseProfitText);
      w.key("buy_monitored");
      w.value(r.buyMonitored);
      w.key("sell_monitored");
      w.value(r.sellMonitored);
      w.key("score");
      w.value(r.score);
      w.key("buy_location");
      w.value(r.buyLocation);
      w.key("sell_location");
      w.value(r.sellLocation);
      w.key("raw_stock_scu");
      w.value(r.rawStockScu);
      w.key("estimated_stock_scu");
      w.value(r.estimatedStockScu);
      w.key("report_age_hours");
      w.value(r.reportAgeHours);
    }
    w.endObject();
  }
  w.endArray();

  w.key("notices");
  w.beginArray();
  for (const auto& n : report.notices) w.value(n);
  w.endArray();
  w.endObject();
}

void writeRouteReportText(std::ostream& out, const RouteReport& report) {
  out << "Status: " << toString(report.status) << "\n";
  if (!report.message.empty()) out << report.message << "\n";
  if (report.routes.empty()) {
    for (const auto& n : report.notices) out << n << "\n";
    return;
  }

  out << std::fixed;
  for (const auto& r : report.routes) {
    out << "\n#" << r.rank << " " << r.commodity;
    if (!r.commodityCode.empty()) out << " (" << r.commodityCode << ")";
    out << "\n"
        << "   buy  " << std::setprecision(2) << r.buyPrice << " at " << r.buyTerminal
        << " [" << r.buyInventory << "]\n"
        << "   sell " << std::setprecision(2) << r.sellPrice << " at " << r.sellTerminal
        << " [" << r.sellInventory << "]\n"
        << "   qty  " << std::setprecision(0) << r.quantity << " SCU, profit " << r.absoluteProfit << " aUEC\n";

    if (report.advancedInfo) {
      out << "   margin " << r.marginText << ", base profit " << r.baseProfitText
          << ", score " << std::setprecision(1) << r.score << "\n"
          << "   monitored: buy=" << (r.buyMonitored ? "yes" : "no")
          << " sell=" << (r.sellMonitored ? "yes" : "no") << "\n";
      if (!r.buyLocation.empty()) out << "   from " << r.buyLocation << "\n";
      if (!r.sellLocation.empty()) out << "   to   " << r.sellLocation << "\n";
      out << "   stock " << std::setprecision(0) << r.rawStockScu << " SCU reported, "
          << r.estimatedStockScu << " SCU estimated, report age "
          << std::setprecision(1) << r.reportAgeHours << " h\n";
    }
  }
  out.unsetf(std::ios::floatfield);

  if (!report.notices.empty()) out << "\n";
  for (const auto& n : report.notices) out << n << "\n";
}

ProfitReport shapeProfitReport(const ProfitFigures& figures, bool hasQuantity) {
  ProfitReport rep;
  rep.status = TradeStatus::OkWithRoutes;
  rep.figures = figures;
  rep.hasQuantity = hasQuantity;
  rep.marginText = formatPercent(figures.marginPercent);
  rep.baseProfitText = formatPercent(figures.baseProfitPercent);

  std::ostringstream msg;
  msg << std::fixed << std::setprecision(2);
  if (hasQuantity) {
    msg << "Profit " << figures.absoluteProfit << " aUEC for " << std::setprecision(0) << figures.quantity
        << " SCU, margin " << rep.marginText << ".";
  } else {
    msg << "Profit " << figures.profitPerUnit << " aUEC per SCU, margin " << rep.marginText << ".";
  }
  rep.message = msg.str();
  return rep;
}

void writeProfitReportJson(core::JsonWriter& w, const ProfitReport& report) {
  w.beginObject();
  w.key("status");
  w.value(toString(report.status));
  w.key("message");
  w.value(report.message);
  if (isOk(report.status)) {
    w.key("buy_price");
    w.value(report.figures.buyPrice);
    w.key("sell_price");
    w.value(report.figures.sellPrice);
    w.key("profit_per_unit");
    w.value(report.figures.profitPerUnit);
    if (report.hasQuantity) {
      w.key("quantity_scu");
      w.value(report.figures.quantity);
      w.key("absolute_profit");
      w.value(report.figures.absoluteProfit);
    }
    w.key("margin_percent");
    w.value(report.figures.marginPercent);
    w.key("margin");
    w.value(report.marginText);
    w.key("base_profit_percent");
    w.value(report.figures.baseProfitPercent);
    w.key("base_profit");
    w.value(report.baseProfitText);
  }
  w.endObject();
}

void writeProfitReportText(std::ostream& out, const ProfitReport& report) {
  out << "Status: " << toString(report.status) << "\n";
  if (!report.message.empty()) out << report.message << "\n";
  if (!isOk(report.status)) return;

  out << std::fixed << std::setprecision(2)
      << "  buy " << report.figures.buyPrice << ", sell " << report.figures.sellPrice
      << ", per unit " << report.figures.profitPerUnit << "\n";
  if (report.hasQuantity) {
    out << "  quantity " << std::setprecision(0) << report.figures.quantity
        << " SCU, profit " << std::setprecision(2) << report.figures.absoluteProfit << "\n";
  }
  out << "  margin " << report.marginText << ", base profit " << report.baseProfitText << "\n";
  out.unsetf(std::ios::floatfield);
}

} // namespace tradelane::trade
