#include "tradelane/trade/ProfitCalculator.h"

#include <cmath>

namespace tradelane::trade {

static bool checkPrices(double buyPrice, double sellPrice, std::string* outError) {
  if (!std::isfinite(buyPrice) || !std::isfinite(sellPrice)) {
    if (outError) *outError = "prices must be finite numbers";
    return false;
  }
  if (buyPrice <= 0.0) {
    if (outError) *outError = "buy price must be greater than zero";
    return false;
  }
  return true;
}

bool baseProfitPercent(double buyPrice, double sellPrice, double& out, std::string* outError) {
  if (!checkPrices(buyPrice, sellPrice, outError)) return false;
  out = (sellPrice - buyPrice) / buyPrice * 100.0;
  return true;
}

bool calculateProfit(double buyPrice, double sellPrice, double quantity,
                     ProfitFigures& out, std::string* outError) {
  if (!checkPrices(buyPrice, sellPrice, outError)) return false;
  if (!std::isfinite(quantity) || quantity <= 0.0) {
    if (outError) *outError = "quantity must be greater than zero";
    return false;
  }

  ProfitFigures f;
  f.buyPrice = buyPrice;
  f.sellPrice = sellPrice;
  f.quantity = quantity;
  f.profitPerUnit = sellPrice - buyPrice;
  f.absoluteProfit = f.profitPerUnit * quantity;
  f.marginPercent = f.profitPerUnit / buyPrice * 100.0;
  f.baseProfitPercent = f.marginPercent;
  out = f;
  return true;
}

} // namespace tradelane::trade
