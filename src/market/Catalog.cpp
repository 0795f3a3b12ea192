#include "tradelane/market/Catalog.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace tradelane::market {

static const char* const kStatusNames[] = {
  "Unknown", "Out of Stock", "Very Low", "Low", "Medium", "High", "Very High", "Maximum",
};

// Uppercase, alphanumerics only: "Out of Stock" == "out_of_stock" == "OUTOFSTOCK".
static std::string normalizeName(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const unsigned char uc : s) {
    if (std::isalnum(uc)) out.push_back((char)std::toupper(uc));
  }
  return out;
}

std::string_view inventoryStatusName(InventoryStatus s) {
  const auto i = static_cast<std::size_t>(s);
  if (i >= sizeof(kStatusNames) / sizeof(kStatusNames[0])) return "Unknown";
  return kStatusNames[i];
}

bool tryParseInventoryStatus(std::string_view text, InventoryStatus& out) {
  const std::string tok = normalizeName(text);
  if (tok.empty()) return false;

  for (std::size_t i = 0; i < sizeof(kStatusNames) / sizeof(kStatusNames[0]); ++i) {
    if (tok == normalizeName(kStatusNames[i])) {
      out = static_cast<InventoryStatus>(i);
      return true;
    }
  }

  // Numeric form used by the upstream API (0 = unknown, 1 = out of stock .. 7 = maximum).
  if (tok.size() == 1 && tok[0] >= '0' && tok[0] <= '7') {
    out = static_cast<InventoryStatus>(tok[0] - '0');
    return true;
  }
  return false;
}

std::string Location::path() const {
  std::string out;
  for (const std::string* part : {&system, &planet, &station}) {
    if (part->empty()) continue;
    if (!out.empty()) out += " > ";
    out += *part;
  }
  return out;
}

const CommodityListing* Commodity::listingAt(TerminalId terminal) const {
  for (const auto& l : listings) {
    if (l.terminal == terminal) return &l;
  }
  return nullptr;
}

MarketSnapshot::MarketSnapshot(std::vector<Commodity> commodities, std::vector<Terminal> terminals, double capturedAtSec)
  : commodities_(std::move(commodities)), terminals_(std::move(terminals)), capturedAtSec_(capturedAtSec) {
  std::sort(commodities_.begin(), commodities_.end(), [](const Commodity& a, const Commodity& b) { return a.id < b.id; });
  std::sort(terminals_.begin(), terminals_.end(), [](const Terminal& a, const Terminal& b) { return a.id < b.id; });
  for (auto& c : commodities_) {
    std::sort(c.listings.begin(), c.listings.end(), [](const CommodityListing& a, const CommodityListing& b) {
      return a.terminal < b.terminal;
    });
  }
}

const Commodity* MarketSnapshot::findCommodity(CommodityId id) const {
  const auto it = std::lower_bound(commodities_.begin(), commodities_.end(), id,
                                   [](const Commodity& c, CommodityId v) { return c.id < v; });
  if (it == commodities_.end() || it->id != id) return nullptr;
  return &*it;
}

const Terminal* MarketSnapshot::findTerminal(TerminalId id) const {
  const auto it = std::lower_bound(terminals_.begin(), terminals_.end(), id,
                                   [](const Terminal& t, TerminalId v) { return t.id < v; });
  if (it == terminals_.end() || it->id != id) return nullptr;
  return &*it;
}

const Commodity* MarketSnapshot::findCommodityByName(std::string_view codeOrName) const {
  const std::string tok = normalizeName(codeOrName);
  if (tok.empty()) return nullptr;

  for (const auto& c : commodities_) {
    if (!c.code.empty() && tok == normalizeName(c.code)) return &c;
  }
  for (const auto& c : commodities_) {
    if (tok == normalizeName(c.name)) return &c;
  }
  return nullptr;
}

bool MarketSnapshot::terminalMatchesLocation(const Terminal& t, std::string_view query) {
  const std::string q = normalizeName(query);
  if (q.empty()) return true;

  return q == normalizeName(t.name) ||
         q == normalizeName(t.location.station) ||
         q == normalizeName(t.location.planet) ||
         q == normalizeName(t.location.system);
}

bool MarketSnapshot::locationKnown(std::string_view query) const {
  for (const auto& t : terminals_) {
    if (terminalMatchesLocation(t, query)) return true;
  }
  return false;
}

static bool allFinite(const CommodityListing& l) {
  return std::isfinite(l.buyPrice) && std::isfinite(l.sellPrice) &&
         std::isfinite(l.stockScu) && std::isfinite(l.demandScu) &&
         std::isfinite(l.reportedAtSec) && std::isfinite(l.stockCeilingScu) &&
         std::isfinite(l.equilibriumScu) && std::isfinite(l.replenishScuPerHour);
}

bool makeSnapshot(std::vector<Commodity> commodities,
                  std::vector<Terminal> terminals,
                  double capturedAtSec,
                  MarketSnapshot& out,
                  std::string* outError,
                  std::vector<std::string>* outWarnings) {
  auto fail = [&](const std::string& msg) {
    if (outError) *outError = msg;
    return false;
  };
  auto warn = [&](const std::string& msg) {
    if (outWarnings) outWarnings->push_back(msg);
  };

  if (!std::isfinite(capturedAtSec)) return fail("snapshot capture time is not finite");

  std::vector<TerminalId> terminalIds;
  terminalIds.reserve(terminals.size());
  for (const auto& t : terminals) terminalIds.push_back(t.id);
  std::sort(terminalIds.begin(), terminalIds.end());
  if (std::adjacent_find(terminalIds.begin(), terminalIds.end()) != terminalIds.end()) {
    return fail("duplicate terminal id");
  }

  std::vector<CommodityId> commodityIds;
  commodityIds.reserve(commodities.size());
  for (const auto& c : commodities) commodityIds.push_back(c.id);
  std::sort(commodityIds.begin(), commodityIds.end());
  if (std::adjacent_find(commodityIds.begin(), commodityIds.end()) != commodityIds.end()) {
    return fail("duplicate commodity id");
  }

  for (auto& c : commodities) {
    std::vector<TerminalId> seen;
    seen.reserve(c.listings.size());

    for (auto& l : c.listings) {
      std::ostringstream where;
      where << "commodity " << c.id << " at terminal " << l.terminal;

      if (!std::binary_search(terminalIds.begin(), terminalIds.end(), l.terminal)) {
        return fail(where.str() + ": unknown terminal");
      }
      if (!allFinite(l)) return fail(where.str() + ": non-finite value");
      seen.push_back(l.terminal);

      if (l.buyPrice < 0.0 || l.sellPrice < 0.0) {
        warn(where.str() + ": negative price clamped to 0");
        l.buyPrice = std::max(0.0, l.buyPrice);
        l.sellPrice = std::max(0.0, l.sellPrice);
      }
      if (l.stockScu < 0.0) {
        warn(where.str() + ": negative stock clamped to 0");
        l.stockScu = 0.0;
      }
      if (l.demandScu < 0.0) {
        warn(where.str() + ": negative demand clamped to 0");
        l.demandScu = 0.0;
      }
      if (l.stockCeilingScu > 0.0 && l.stockCeilingScu < l.stockScu) {
        warn(where.str() + ": ceiling below reported stock, raised");
        l.stockCeilingScu = l.stockScu;
      }
    }

    std::sort(seen.begin(), seen.end());
    if (std::adjacent_find(seen.begin(), seen.end()) != seen.end()) {
      std::ostringstream oss;
      oss << "commodity " << c.id << ": duplicate listing for one terminal";
      return fail(oss.str());
    }
  }

  out = MarketSnapshot(std::move(commodities), std::move(terminals), capturedAtSec);
  return true;
}

} // namespace tradelane::market
