#pragma once

#include "tradelane/market/Catalog.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace tradelane::market {

// Line-based catalog snapshot format.
//
//   tradelane-catalog 1
//   captured <epochSec>
//   terminal <id> "<name>" system=<s> planet=<p> station=<s> requires_dock=0|1 has_dock=0|1 elevator=0|1 monitored=0|1
//   commodity <id> <CODE> "<name>" legal=0|1
//   listing <commodityId> <terminalId> buy=<p> sell=<p> stock=<scu> demand=<scu> reported=<epochSec>
//           [ceiling=<scu>] [equilibrium=<scu>] [rate=<scu/h>] [buy_status=<s>] [sell_status=<s>]
//
// '#' starts a comment outside quotes. Values containing spaces are quoted.
// Listings may appear before or after their commodity line.
//
// Parsed data goes through makeSnapshot(), so the result is validated.
bool parseCatalog(std::istream& in,
                  const std::string& sourceName,
                  MarketSnapshot& out,
                  std::string* outError = nullptr,
                  std::vector<std::string>* outWarnings = nullptr);

bool loadCatalogFile(const std::string& path,
                     MarketSnapshot& out,
                     std::string* outError = nullptr,
                     std::vector<std::string>* outWarnings = nullptr);

void writeCatalog(std::ostream& out, const MarketSnapshot& snapshot);

bool saveCatalogFile(const std::string& path, const MarketSnapshot& snapshot, std::string* outError = nullptr);

} // namespace tradelane::market
