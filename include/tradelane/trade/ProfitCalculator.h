#pragma once

#include <string>

namespace tradelane::trade {

struct ProfitFigures {
  double buyPrice{0.0};
  double sellPrice{0.0};
  double quantity{0.0};

  double profitPerUnit{0.0};
  double absoluteProfit{0.0};     // (sell - buy) * quantity
  double marginPercent{0.0};      // (sell - buy) / buy * 100
  double baseProfitPercent{0.0};  // per-unit, independent of quantity
};

// Profit math for one buy -> sell trade. Loss-making inputs are valid and give
// negative figures.
//
// Fails (returns false, `out` untouched) when buy <= 0, quantity <= 0, or any
// input is not finite.
bool calculateProfit(double buyPrice, double sellPrice, double quantity,
                     ProfitFigures& out, std::string* outError = nullptr);

// Quantity-free variant for callers that only know the two prices.
bool baseProfitPercent(double buyPrice, double sellPrice, double& out, std::string* outError = nullptr);

} // namespace tradelane::trade
