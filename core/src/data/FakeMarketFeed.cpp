#include "pd/data/FakeMarketFeed.hpp"

#include <algorithm>
#include <chrono>

namespace pd {

FakeMarketFeed::FakeMarketFeed(const FakeMarketFeedConfig& config)
    : config_(config), seed_(config.seed) {
  seedHistory();
}

FakeMarketFeed::~FakeMarketFeed() { stop(); }

double FakeMarketFeed::rng() {
  // LCG, uniform in [0, 1]
  seed_ = seed_ * 1103515245u + 12345u;
  return static_cast<double>((seed_ >> 16) & 0x7FFF) / 32767.0;
}

void FakeMarketFeed::seedHistory() {
  coins_.clear();
  candles_.clear();
  const std::int64_t t0 = 1700000000;

  for (const auto& fc : config_.coins) {
    std::vector<Candle> series;
    double price = fc.startPrice;
    for (std::size_t i = 0; i < config_.historyCandles; i++) {
      Candle c;
      c.time = t0 + static_cast<std::int64_t>(i) * config_.candleSeconds;
      c.open = price;
      price *= 1.0 + (rng() - 0.5) * config_.volatility * 6.0;
      c.close = price;
      c.high = std::max(c.open, c.close) * (1.0 + rng() * config_.volatility);
      c.low = std::min(c.open, c.close) * (1.0 - rng() * config_.volatility);
      c.volume = 50.0 + rng() * 950.0;
      series.push_back(c);
    }

    CoinRecord rec;
    rec.symbol = fc.symbol;
    rec.price = price;
    rec.prevPrice = price;
    rec.change24h = 0.0;
    rec.high24h = price;
    rec.low24h = price;
    for (const auto& c : series) {
      rec.high24h = std::max(rec.high24h, c.high);
      rec.low24h = std::min(rec.low24h, c.low);
      rec.volume24h += c.volume * c.close;
    }
    if (!series.empty() && series.front().open > 0.0) {
      rec.change24h = (price - series.front().open) / series.front().open * 100.0;
    }
    coins_.push_back(rec);
    candles_.push_back(std::move(series));
  }
}

MarketSnapshot FakeMarketFeed::next() {
  const bool newCandle = ++tickInCandle_ >= config_.ticksPerCandle;
  if (newCandle) tickInCandle_ = 0;

  for (std::size_t i = 0; i < coins_.size(); i++) {
    CoinRecord& rec = coins_[i];
    auto& series = candles_[i];

    double step = (rng() - 0.5) * config_.volatility * 2.0;
    rec.prevPrice = rec.price;
    rec.price = std::max(rec.price * (1.0 + step), 1e-8);
    rec.high24h = std::max(rec.high24h, rec.price);
    rec.low24h = std::min(rec.low24h, rec.price);
    double tradedVolume = 1.0 + rng() * 20.0;
    rec.volume24h += tradedVolume * rec.price;
    if (!series.empty() && series.front().open > 0.0) {
      rec.change24h = (rec.price - series.front().open) / series.front().open * 100.0;
    }

    if (newCandle || series.empty()) {
      Candle c;
      c.time = series.empty() ? 0 : series.back().time + config_.candleSeconds;
      c.open = rec.prevPrice;
      c.high = std::max(rec.prevPrice, rec.price);
      c.low = std::min(rec.prevPrice, rec.price);
      c.close = rec.price;
      c.volume = tradedVolume;
      series.push_back(c);
      if (series.size() > config_.maxCandles) series.erase(series.begin());
    } else {
      Candle& c = series.back();
      c.close = rec.price;
      c.high = std::max(c.high, rec.price);
      c.low = std::min(c.low, rec.price);
      c.volume += tradedVolume;
    }
  }

  MarketSnapshot snap;
  snap.sequence = ++sequence_;
  snap.coins = coins_;
  snap.candles = candles_;
  return snap;
}

void FakeMarketFeed::start() {
  if (running_.load()) return;
  running_.store(true);
  thread_ = std::thread(&FakeMarketFeed::producerLoop, this);
}

void FakeMarketFeed::stop() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
}

void FakeMarketFeed::producerLoop() {
  using Clock = std::chrono::steady_clock;
  auto nextTick = Clock::now();

  // Emit the first snapshot immediately
  queue_.push(next());

  while (running_.load()) {
    nextTick += std::chrono::milliseconds(config_.tickIntervalMs);
    std::this_thread::sleep_until(nextTick);
    if (!running_.load()) break;
    queue_.push(next());
  }
}

} // namespace pd
