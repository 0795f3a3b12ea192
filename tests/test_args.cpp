#include "tradelane/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using tradelane::core::Args;

  // Typical route query.
  {
    auto argv = makeArgv({"tradelane_cli", "--routes", "--cargo", "96", "--budget=250000",
                          "--location", "Port Olisar", "--advanced"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("routes") || !args.hasFlag("advanced")) {
      std::cerr << "[test_args] expected --routes and --advanced flags\n";
      ++fails;
    }
    double cargo = 0.0;
    double budget = 0.0;
    if (!args.getDouble("cargo", cargo) || cargo != 96.0) {
      std::cerr << "[test_args] expected --cargo 96\n";
      ++fails;
    }
    if (!args.getDouble("budget", budget) || budget != 250000.0) {
      std::cerr << "[test_args] expected --budget=250000\n";
      ++fails;
    }
    std::string loc;
    if (!args.getString("location", loc) || loc != "Port Olisar") {
      std::cerr << "[test_args] expected --location 'Port Olisar'\n";
      ++fails;
    }
  }

  // Negative numbers are values, not switches.
  {
    auto argv = makeArgv({"app", "--buy", "-1", "--sell", "-2.5e1"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    double buy = 0.0;
    double sell = 0.0;
    if (!args.getDouble("buy", buy) || std::abs(buy + 1.0) > 1e-12 ||
        !args.getDouble("sell", sell) || std::abs(sell + 25.0) > 1e-12) {
      std::cerr << "[test_args] expected negative numeric values to parse\n";
      ++fails;
    }
  }

  // Declared flags never swallow the next token.
  {
    auto argv = makeArgv({"app", "--json", "catalog.txt"});
    Args args;
    args.declareFlag("json");
    args.parse((int)argv.size(), argv.data());
    if (!args.hasFlag("json") || args.positional().size() != 1 || args.positional()[0] != "catalog.txt") {
      std::cerr << "[test_args] expected --json to stay a flag\n";
      ++fails;
    }
  }

  // The end-of-options marker forces everything after it to be positional.
  {
    auto argv = makeArgv({"app", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("flag") || args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // Typed getters reject malformed values and leave the output untouched.
  {
    auto argv = makeArgv({"app", "--count", "-3", "--threads", "4x", "--qty", "abc"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    std::size_t count = 7;
    std::size_t threads = 7;
    double qty = 1.5;
    if (args.getSize("count", count) || count != 7 ||
        args.getSize("threads", threads) || threads != 7 ||
        args.getDouble("qty", qty) || qty != 1.5) {
      std::cerr << "[test_args] expected malformed values to be rejected\n";
      ++fails;
    }
    if (!args.has("count")) {
      std::cerr << "[test_args] expected has(count)\n";
      ++fails;
    }
  }

  // Last occurrence wins; short flags group.
  {
    auto argv = makeArgv({"app", "--count", "2", "--count", "5", "-hv"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    std::size_t count = 0;
    if (!args.getSize("count", count) || count != 5) {
      std::cerr << "[test_args] expected last --count to win\n";
      ++fails;
    }
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  // Malformed optional values are present but do not parse, and leave the default alone.
  {
    auto argv = makeArgv({"tradelane_cli", "--routes", "--now", "noon", "--threads=-2", "--count"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    double now = 42.0;
    std::size_t threads = 4;
    std::size_t count = 5;
    if (!args.has("now") || args.getDouble("now", now) || now != 42.0) {
      std::cerr << "[test_args] expected --now noon to be present but rejected\n";
      ++fails;
    }
    if (!args.has("threads") || args.getSize("threads", threads) || threads != 4) {
      std::cerr << "[test_args] expected --threads=-2 to be present but rejected\n";
      ++fails;
    }
    if (!args.has("count") || args.getSize("count", count) || count != 5) {
      std::cerr << "[test_args] expected bare --count to be present but rejected\n";
      ++fails;
    }
    if (args.has("budget")) {
      std::cerr << "[test_args] did not expect --budget\n";
      ++fails;
    }
  }

  return fails;
}
