#pragma once
#include "pd/chart/Candle.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pd {

struct CoinRecord {
  std::string symbol;       // e.g. "BTC"
  double price{0};
  double prevPrice{0};      // price at the previous tick
  double change24h{0};      // percent
  double volume24h{0};      // quote currency
  double high24h{0};
  double low24h{0};
};

// Everything a producer hands to the render loop in one replace.
// candles[i] belongs to coins[i].
struct MarketSnapshot {
  std::uint64_t sequence{0};
  std::vector<CoinRecord> coins;
  std::vector<std::vector<Candle>> candles;
};

} // namespace pd
