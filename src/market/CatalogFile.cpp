#include "tradelane/market/CatalogFile.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tradelane::market {

namespace {

constexpr const char* kHeader = "tradelane-catalog";
constexpr int kVersion = 1;

// Whitespace-separated tokens; double quotes group, backslash escapes inside quotes.
bool tokenize(const std::string& line, std::vector<std::string>& out, std::string& err) {
  out.clear();
  std::string cur;
  bool inQuote = false;
  bool hasToken = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (inQuote) {
      if (c == '\\' && i + 1 < line.size()) {
        cur.push_back(line[++i]);
      } else if (c == '"') {
        inQuote = false;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '#') break;
    if (c == '"') {
      inQuote = true;
      hasToken = true;
      continue;
    }
    if (std::isspace((unsigned char)c)) {
      if (hasToken) out.push_back(std::move(cur));
      cur.clear();
      hasToken = false;
      continue;
    }
    cur.push_back(c);
    hasToken = true;
  }

  if (inQuote) {
    err = "unterminated quote";
    return false;
  }
  if (hasToken) out.push_back(std::move(cur));
  return true;
}

bool parseU32(std::string_view s, core::u32& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+') return false;
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
  if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
  if (v > std::numeric_limits<core::u32>::max()) return false;
  out = (core::u32)v;
  return true;
}

bool parseNumber(std::string_view s, double& out) {
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

bool parseFlag(std::string_view s, bool& out) {
  if (s == "1" || s == "true" || s == "yes") { out = true; return true; }
  if (s == "0" || s == "false" || s == "no") { out = false; return true; }
  return false;
}

// key=value attributes after the positional fields.
class Attributes {
public:
  bool parse(const std::vector<std::string>& tokens, std::size_t first, std::string& err) {
    for (std::size_t i = first; i < tokens.size(); ++i) {
      const auto eq = tokens[i].find('=');
      if (eq == std::string::npos || eq == 0) {
        err = "expected key=value, got '" + tokens[i] + "'";
        return false;
      }
      kv_[tokens[i].substr(0, eq)] = tokens[i].substr(eq + 1);
    }
    return true;
  }

  bool text(const char* key, std::string& out) {
    const auto it = kv_.find(key);
    if (it == kv_.end()) return true;
    out = it->second;
    kv_.erase(it);
    return true;
  }

  bool number(const char* key, double& out, std::string& err) {
    const auto it = kv_.find(key);
    if (it == kv_.end()) return true;
    if (!parseNumber(it->second, out)) {
      err = std::string("invalid number for ") + key + ": '" + it->second + "'";
      return false;
    }
    kv_.erase(it);
    return true;
  }

  bool flag(const char* key, bool& out, std::string& err) {
    const auto it = kv_.find(key);
    if (it == kv_.end()) return true;
    if (!parseFlag(it->second, out)) {
      err = std::string("invalid flag for ") + key + ": '" + it->second + "'";
      return false;
    }
    kv_.erase(it);
    return true;
  }

  bool status(const char* key, InventoryStatus& out, std::string& err) {
    const auto it = kv_.find(key);
    if (it == kv_.end()) return true;
    if (!tryParseInventoryStatus(it->second, out)) {
      err = std::string("invalid inventory status for ") + key + ": '" + it->second + "'";
      return false;
    }
    kv_.erase(it);
    return true;
  }

  // Call after all known keys were consumed.
  bool noneLeft(std::string& err) const {
    if (kv_.empty()) return true;
    err = "unknown attribute '" + kv_.begin()->first + "'";
    return false;
  }

private:
  std::unordered_map<std::string, std::string> kv_;
};

struct PendingListing {
  CommodityId commodity{0};
  int line{0};
  CommodityListing listing;
};

std::string quoted(std::string_view s) {
  std::string out = "\"";
  for (const char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace

bool parseCatalog(std::istream& in,
                  const std::string& sourceName,
                  MarketSnapshot& out,
                  std::string* outError,
                  std::vector<std::string>* outWarnings) {
  std::vector<Terminal> terminals;
  std::vector<Commodity> commodities;
  std::vector<PendingListing> listings;
  std::unordered_map<CommodityId, std::size_t> commodityIndex;
  double capturedAtSec = 0.0;
  bool sawHeader = false;

  std::string line;
  std::vector<std::string> tok;
  std::string err;
  int lineNo = 0;

  auto fail = [&](const std::string& msg) {
    if (outError) {
      std::ostringstream oss;
      oss << sourceName << ":" << lineNo << ": " << msg;
      *outError = oss.str();
    }
    return false;
  };

  while (std::getline(in, line)) {
    ++lineNo;
    if (!tokenize(line, tok, err)) return fail(err);
    if (tok.empty()) continue;

    const std::string& kind = tok[0];

    if (!sawHeader) {
      if (kind != kHeader || tok.size() != 2) return fail("expected header 'tradelane-catalog 1'");
      core::u32 version = 0;
      if (!parseU32(tok[1], version) || (int)version != kVersion) {
        return fail("unsupported catalog version '" + tok[1] + "'");
      }
      sawHeader = true;
      continue;
    }

    if (kind == "captured") {
      if (tok.size() != 2 || !parseNumber(tok[1], capturedAtSec)) return fail("expected 'captured <epochSec>'");
      continue;
    }

    if (kind == "terminal") {
      if (tok.size() < 3) return fail("expected 'terminal <id> <name> ...'");
      Terminal t;
      if (!parseU32(tok[1], t.id)) return fail("invalid terminal id '" + tok[1] + "'");
      t.name = tok[2];

      Attributes a;
      if (!a.parse(tok, 3, err)) return fail(err);
      if (!a.text("system", t.location.system) ||
          !a.text("planet", t.location.planet) ||
          !a.text("station", t.location.station) ||
          !a.flag("requires_dock", t.requiresLoadingDock, err) ||
          !a.flag("has_dock", t.hasLoadingDock, err) ||
          !a.flag("elevator", t.hasFreightElevator, err) ||
          !a.flag("monitored", t.isMonitored, err) ||
          !a.noneLeft(err)) {
        return fail(err);
      }
      terminals.push_back(std::move(t));
      continue;
    }

    if (kind == "commodity") {
      if (tok.size() < 4) return fail("expected 'commodity <id> <CODE> <name> ...'");
      Commodity c;
      if (!parseU32(tok[1], c.id)) return fail("invalid commodity id '" + tok[1] + "'");
      c.code = tok[2];
      c.name = tok[3];

      Attributes a;
      if (!a.parse(tok, 4, err)) return fail(err);
      if (!a.flag("legal", c.legal, err) || !a.noneLeft(err)) return fail(err);

      if (commodityIndex.count(c.id) != 0) return fail("duplicate commodity id " + tok[1]);
      commodityIndex[c.id] = commodities.size();
      commodities.push_back(std::move(c));
      continue;
    }

    if (kind == "listing") {
      if (tok.size() < 3) return fail("expected 'listing <commodityId> <terminalId> ...'");
      PendingListing p;
      p.line = lineNo;
      if (!parseU32(tok[1], p.commodity)) return fail("invalid commodity id '" + tok[1] + "'");
      if (!parseU32(tok[2], p.listing.terminal)) return fail("invalid terminal id '" + tok[2] + "'");

      auto& l = p.listing;
      Attributes a;
      if (!a.parse(tok, 3, err)) return fail(err);
      if (!a.number("buy", l.buyPrice, err) ||
          !a.number("sell", l.sellPrice, err) ||
          !a.number("stock", l.stockScu, err) ||
          !a.number("demand", l.demandScu, err) ||
          !a.number("reported", l.reportedAtSec, err) ||
          !a.number("ceiling", l.stockCeilingScu, err) ||
          !a.number("equilibrium", l.equilibriumScu, err) ||
          !a.number("rate", l.replenishScuPerHour, err) ||
          !a.status("buy_status", l.buyStatus, err) ||
          !a.status("sell_status", l.sellStatus, err) ||
          !a.noneLeft(err)) {
        return fail(err);
      }
      listings.push_back(std::move(p));
      continue;
    }

    return fail("unknown record '" + kind + "'");
  }

  if (!sawHeader) return fail("empty catalog");

  for (auto& p : listings) {
    const auto it = commodityIndex.find(p.commodity);
    if (it == commodityIndex.end()) {
      lineNo = p.line;
      return fail("listing for unknown commodity " + std::to_string(p.commodity));
    }
    commodities[it->second].listings.push_back(std::move(p.listing));
  }

  if (!makeSnapshot(std::move(commodities), std::move(terminals), capturedAtSec, out, &err, outWarnings)) {
    if (outError) *outError = sourceName + ": " + err;
    return false;
  }
  return true;
}

bool loadCatalogFile(const std::string& path,
                     MarketSnapshot& out,
                     std::string* outError,
                     std::vector<std::string>* outWarnings) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open catalog file: " + path;
    return false;
  }
  return parseCatalog(in, path, out, outError, outWarnings);
}

void writeCatalog(std::ostream& out, const MarketSnapshot& snapshot) {
  out << kHeader << " " << kVersion << "\n";
  out << std::setprecision(15);
  out << "captured " << snapshot.capturedAtSec() << "\n\n";

  for (const auto& t : snapshot.terminals()) {
    out << "terminal " << t.id << " " << quoted(t.name)
        << " system=" << quoted(t.location.system)
        << " planet=" << quoted(t.location.planet)
        << " station=" << quoted(t.location.station)
        << " requires_dock=" << (t.requiresLoadingDock ? 1 : 0)
        << " has_dock=" << (t.hasLoadingDock ? 1 : 0)
        << " elevator=" << (t.hasFreightElevator ? 1 : 0)
        << " monitored=" << (t.isMonitored ? 1 : 0) << "\n";
  }
  out << "\n";

  for (const auto& c : snapshot.commodities()) {
    out << "commodity " << c.id << " " << quoted(c.code) << " " << quoted(c.name)
        << " legal=" << (c.legal ? 1 : 0) << "\n";
    for (const auto& l : c.listings) {
      out << "listing " << c.id << " " << l.terminal
          << " buy=" << l.buyPrice
          << " sell=" << l.sellPrice
          << " stock=" << l.stockScu
          << " demand=" << l.demandScu
          << " reported=" << l.reportedAtSec
          << " ceiling=" << l.stockCeilingScu
          << " equilibrium=" << l.equilibriumScu
          << " rate=" << l.replenishScuPerHour
          << " buy_status=" << quoted(inventoryStatusName(l.buyStatus))
          << " sell_status=" << quoted(inventoryStatusName(l.sellStatus)) << "\n";
    }
  }
}

bool saveCatalogFile(const std::string& path, const MarketSnapshot& snapshot, std::string* outError) {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write catalog file: " + path;
    return false;
  }
  writeCatalog(out, snapshot);
  if (!out) {
    if (outError) *outError = "Failed to write catalog file: " + path;
    return false;
  }
  return true;
}

} // namespace tradelane::market
