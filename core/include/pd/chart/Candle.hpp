#pragma once
#include <cstdint>

namespace pd {

// One OHLCV sample. Series are ordered oldest first.
struct Candle {
  std::int64_t time{0};   // unix seconds
  double open{0};
  double high{0};
  double low{0};
  double close{0};
  double volume{0};
};

// close == open counts as bullish.
inline bool isBullish(const Candle& c) { return c.close >= c.open; }

} // namespace pd
