#pragma once

#include "tradelane/core/Types.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tradelane::market {

using CommodityId = core::u32;
using TerminalId = core::u32;

// Terminal-reported inventory level, as shown on the in-game kiosk.
enum class InventoryStatus : core::u8 {
  Unknown = 0,
  OutOfStock,
  VeryLow,
  Low,
  Medium,
  High,
  VeryHigh,
  Maximum,
};

std::string_view inventoryStatusName(InventoryStatus s);
bool tryParseInventoryStatus(std::string_view text, InventoryStatus& out);

struct Location {
  std::string system;
  std::string planet;  // may be empty (deep-space stations)
  std::string station; // may be empty (planetary outposts)

  // "Stanton > Hurston > Lorville", skipping empty parts.
  std::string path() const;
};

struct Terminal {
  TerminalId id{0};
  std::string name;
  Location location;

  bool requiresLoadingDock{false};
  bool hasLoadingDock{false};
  bool hasFreightElevator{false};

  // Prices at this terminal are kept current by the data provider.
  bool isMonitored{false};
};

// One commodity at one terminal.
//
// Prices are from the player's perspective:
//  - buyPrice  > 0: the terminal sells the commodity (player buys here)
//  - sellPrice > 0: the terminal buys the commodity (player sells here)
struct CommodityListing {
  TerminalId terminal{0};

  double buyPrice{0.0};
  double sellPrice{0.0};

  // Last report (SCU).
  double stockScu{0.0};
  double demandScu{0.0};
  double reportedAtSec{0.0};

  // Stock model used by the availability estimator.
  double stockCeilingScu{0.0};      // <= 0: unknown
  double equilibriumScu{-1.0};      // < 0: unknown
  double replenishScuPerHour{-1.0}; // < 0: use configured default

  InventoryStatus buyStatus{InventoryStatus::Unknown};
  InventoryStatus sellStatus{InventoryStatus::Unknown};

  bool buyable() const { return buyPrice > 0.0; }
  bool sellable() const { return sellPrice > 0.0; }
};

struct Commodity {
  CommodityId id{0};
  std::string code;
  std::string name;
  bool legal{true};

  std::vector<CommodityListing> listings;

  const CommodityListing* listingAt(TerminalId terminal) const;
};

// Immutable catalog snapshot consumed by one query.
//
// Commodities and terminals are kept sorted by id so lookups are binary
// searches and iteration order is deterministic.
class MarketSnapshot {
public:
  MarketSnapshot() = default;
  MarketSnapshot(std::vector<Commodity> commodities, std::vector<Terminal> terminals, double capturedAtSec = 0.0);

  const std::vector<Commodity>& commodities() const { return commodities_; }
  const std::vector<Terminal>& terminals() const { return terminals_; }
  double capturedAtSec() const { return capturedAtSec_; }

  bool empty() const { return commodities_.empty() || terminals_.empty(); }

  const Commodity* findCommodity(CommodityId id) const;
  const Terminal* findTerminal(TerminalId id) const;

  // Code or display name, case-insensitive, ignoring spaces and punctuation.
  const Commodity* findCommodityByName(std::string_view codeOrName) const;

  // True if `query` names the terminal, its station, planet, or system.
  static bool terminalMatchesLocation(const Terminal& t, std::string_view query);

  // True if any terminal matches `query`.
  bool locationKnown(std::string_view query) const;

private:
  std::vector<Commodity> commodities_;
  std::vector<Terminal> terminals_;
  double capturedAtSec_{0.0};
};

// Boundary validation for data produced by a market-data client.
//
// Rejects structural errors (duplicate ids, listings pointing at unknown
// terminals, non-finite numbers). Normalizes recoverable data: negative stock
// or prices clamp to 0, and a known ceiling below the reported stock is raised
// to the reported stock. `outWarnings` (optional) receives one line per fix.
// `out` is only assigned on success.
bool makeSnapshot(std::vector<Commodity> commodities,
                  std::vector<Terminal> terminals,
                  double capturedAtSec,
                  MarketSnapshot& out,
                  std::string* outError = nullptr,
                  std::vector<std::string>* outWarnings = nullptr);

} // namespace tradelane::market
