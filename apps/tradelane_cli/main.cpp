#include "tradelane/core/Args.h"
#include "tradelane/core/CVar.h"
#include "tradelane/core/JobSystem.h"
#include "tradelane/core/JsonWriter.h"
#include "tradelane/core/Log.h"
#include "tradelane/market/CatalogFile.h"
#include "tradelane/trade/RoutePlanner.h"
#include "tradelane/trade/TradeConfig.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace tradelane;

static void printHelp() {
  std::cout << "tradelane_cli\n"
            << "  --catalog <path>       Catalog snapshot file (required for --routes)\n"
            << "  --config <path>        Option file (name = value per line)\n"
            << "  --write-config <path>  Write the effective options to a file and exit\n"
            << "  --export-catalog <p>   Re-write the loaded catalog in canonical form\n"
            << "  --json                 Machine-readable output\n"
            << "  --log <level>          trace|debug|info|warn|error|off (overrides log_level)\n"
            << "\n"
            << "  --routes               Find the best commodity trade routes\n"
            << "  --cargo <scu>          Ship cargo capacity (SCU)\n"
            << "  --budget <auec>        Money available for the purchase\n"
            << "  --location <name>      Only buy at terminals in this system/planet/station/terminal\n"
            << "  --count <n>            Number of routes (default: commodity_route_default_count)\n"
            << "  --commodity <c>        Only this commodity (code or name)\n"
            << "  --now <epochSec>       Query time (default: snapshot capture time)\n"
            << "  --estimated | --raw    Estimated or reported stock figures\n"
            << "  --advanced             Include margins, locations, stock and scores\n"
            << "  --ship <name>          Ship name (informational)\n"
            << "  --ship-dock            Ship can use a loading dock\n"
            << "  --ship-elevator        Ship can use a freight elevator\n"
            << "  --ship-needs-dock      Ship can only load at a loading dock (e.g. Hull-C)\n"
            << "  --threads <n>          Candidate builder threads (overrides worker_threads)\n"
            << "\n"
            << "  --profit               Profit calculation\n"
            << "  --buy <price>          Buy price per SCU\n"
            << "  --sell <price>         Sell price per SCU\n"
            << "  --qty <scu>            Quantity (optional)\n";
}

static void printRouteReport(const trade::RouteReport& rep, bool json) {
  if (json) {
    core::JsonWriter w(std::cout);
    trade::writeRouteReportJson(w, rep);
  } else {
    trade::writeRouteReportText(std::cout, rep);
  }
}

static void printProfitReport(const trade::ProfitReport& rep, bool json) {
  if (json) {
    core::JsonWriter w(std::cout);
    trade::writeProfitReportJson(w, rep);
  } else {
    trade::writeProfitReportText(std::cout, rep);
  }
}

static int exitCodeFor(trade::TradeStatus s) {
  switch (s) {
    case trade::TradeStatus::OkWithRoutes:
    case trade::TradeStatus::OkNoProfitableRoute:
      return 0;
    case trade::TradeStatus::InvalidInput:
      return 2;
    case trade::TradeStatus::NoCatalogData:
    case trade::TradeStatus::ToolDisabled:
      return 3;
  }
  return 1;
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  for (const char* f : {"help", "json", "routes", "profit", "estimated", "raw", "advanced",
                        "ship-dock", "ship-elevator", "ship-needs-dock"}) {
    args.declareFlag(f);
  }
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h") || argc <= 1) {
    printHelp();
    return 0;
  }

  const bool json = args.hasFlag("json");

  // Options: defaults, then the option file, then command-line overrides.
  core::CVarRegistry cvars;
  if (!trade::registerTradeCVars(cvars)) {
    std::cerr << "Failed to register options\n";
    return 1;
  }

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!cvars.loadFile(configPath, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
  }

  std::string logOverride;
  if (args.getString("log", logOverride)) {
    std::string err;
    if (!cvars.setString(trade::option::kLogLevel, logOverride, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
  }

  trade::TradeConfig config;
  {
    std::string err;
    if (!trade::loadTradeConfig(cvars, config, &err)) {
      std::cerr << "Invalid options: " << err << "\n";
      return 2;
    }
  }

  core::LogLevel level = core::LogLevel::Info;
  if (core::tryParseLogLevel(config.logLevel, level)) core::setLogLevel(level);

  std::string writeConfigPath;
  if (args.getString("write-config", writeConfigPath)) {
    std::string err;
    if (!cvars.saveFile(writeConfigPath, &err)) {
      std::cerr << err << "\n";
      return 1;
    }
    TRADELANE_LOG_INFO("cli", "Wrote options to " + writeConfigPath);
    return 0;
  }

  if (args.hasFlag("profit")) {
    double buy = 0.0;
    double sell = 0.0;
    if (!args.getDouble("buy", buy) || !args.getDouble("sell", sell)) {
      std::cerr << "--profit needs --buy <price> and --sell <price>\n";
      return 2;
    }
    std::optional<double> qty;
    double q = 0.0;
    if (args.has("qty")) {
      if (!args.getDouble("qty", q)) {
        std::cerr << "--qty must be a number\n";
        return 2;
      }
      qty = q;
    }

    const trade::ProfitReport rep = trade::runProfitTool(config, buy, sell, qty);
    printProfitReport(rep, json);
    return exitCodeFor(rep.status);
  }

  std::string catalogPath;
  if (!args.getString("catalog", catalogPath)) {
    std::cerr << "Missing --catalog <path> (see --help)\n";
    return 2;
  }

  market::MarketSnapshot snapshot;
  {
    std::string err;
    std::vector<std::string> warnings;
    if (!market::loadCatalogFile(catalogPath, snapshot, &err, &warnings)) {
      std::cerr << err << "\n";
      return 2;
    }
    for (const auto& w : warnings) TRADELANE_LOG_WARN("catalog", w);
    TRADELANE_LOG_DEBUG("catalog", "Loaded " + std::to_string(snapshot.commodities().size()) + " commodities, " +
                                   std::to_string(snapshot.terminals().size()) + " terminals from " + catalogPath);
  }

  std::string exportPath;
  if (args.getString("export-catalog", exportPath)) {
    std::string err;
    if (!market::saveCatalogFile(exportPath, snapshot, &err)) {
      std::cerr << err << "\n";
      return 1;
    }
    TRADELANE_LOG_INFO("cli", "Wrote catalog to " + exportPath);
    if (!args.hasFlag("routes")) return 0;
  }

  if (!args.hasFlag("routes")) {
    std::cerr << "Nothing to do: pass --routes or --profit (see --help)\n";
    return 2;
  }

  trade::TradeConstraints q;
  (void)args.getString("ship", q.ship.name);
  q.ship.hasLoadingDock = args.hasFlag("ship-dock");
  q.ship.hasFreightElevator = args.hasFlag("ship-elevator");
  q.ship.requiresLoadingDock = args.hasFlag("ship-needs-dock");
  if (!args.getDouble("cargo", q.ship.cargoScu)) {
    std::cerr << "--routes needs --cargo <scu>\n";
    return 2;
  }
  if (!args.getDouble("budget", q.budget)) {
    std::cerr << "--routes needs --budget <auec>\n";
    return 2;
  }
  (void)args.getString("location", q.location);
  (void)args.getString("commodity", q.commodity);
  if (args.has("count") && !args.getSize("count", q.count)) {
    std::cerr << "--count must be a non-negative integer\n";
    return 2;
  }

  q.nowSec = snapshot.capturedAtSec();
  if (args.has("now") && !args.getDouble("now", q.nowSec)) {
    std::cerr << "--now must be a number of seconds\n";
    return 2;
  }

  if (args.hasFlag("estimated")) q.useEstimatedAvailability = true;
  if (args.hasFlag("raw")) q.useEstimatedAvailability = false;
  if (args.hasFlag("advanced")) q.advancedInfo = true;

  std::size_t threads = config.workerThreads;
  if (args.has("threads") && !args.getSize("threads", threads)) {
    std::cerr << "--threads must be a non-negative integer\n";
    return 2;
  }

  std::unique_ptr<core::JobSystem> jobs;
  if (threads != 1) jobs = std::make_unique<core::JobSystem>(threads);

  const auto t0 = std::chrono::steady_clock::now();
  trade::CandidateBuildStats stats;
  const trade::RouteReport rep = trade::planTradeRoutes(snapshot, q, config, jobs.get(), &stats);
  const auto t1 = std::chrono::steady_clock::now();

  if (core::logEnabled(core::LogLevel::Debug)) {
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    TRADELANE_LOG_DEBUG("cli", "Route query took " + std::to_string(ms) + " ms, " + std::to_string(stats.legs) + " legs");
  }

  printRouteReport(rep, json);
  return exitCodeFor(rep.status);
}
