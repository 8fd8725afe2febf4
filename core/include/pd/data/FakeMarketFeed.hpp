#pragma once
#include "pd/data/MarketSnapshot.hpp"
#include "pd/data/SnapshotQueue.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace pd {

struct FakeCoin {
  std::string symbol;
  double startPrice{100.0};
};

struct FakeMarketFeedConfig {
  std::vector<FakeCoin> coins{{"BTC", 67000.0}, {"ETH", 3400.0}, {"SOL", 150.0}};
  int tickIntervalMs{250};
  int ticksPerCandle{8};
  std::int64_t candleSeconds{60};
  std::size_t historyCandles{120};
  std::size_t maxCandles{500};
  double volatility{0.004};    // relative step per tick
  std::uint32_t seed{42};
};

// Random-walk market for demos and tests. next() is deterministic for a
// given seed; start() runs it on a producer thread into a SnapshotQueue.
class FakeMarketFeed {
public:
  explicit FakeMarketFeed(const FakeMarketFeedConfig& config);
  ~FakeMarketFeed();

  FakeMarketFeed(const FakeMarketFeed&) = delete;
  FakeMarketFeed& operator=(const FakeMarketFeed&) = delete;

  // Advances one tick and returns the resulting snapshot. Not thread-safe;
  // do not call while the producer thread runs.
  MarketSnapshot next();

  void start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // Latest snapshot produced by the thread, if any arrived since the last call.
  bool poll(MarketSnapshot& out) { return queue_.drainLatest(out); }

private:
  void producerLoop();
  double rng();
  void seedHistory();

  FakeMarketFeedConfig config_;
  SnapshotQueue<MarketSnapshot> queue_{4};
  std::thread thread_;
  std::atomic<bool> running_{false};

  // Producer state
  std::uint32_t seed_;
  std::uint64_t sequence_{0};
  int tickInCandle_{0};
  std::vector<CoinRecord> coins_;
  std::vector<std::vector<Candle>> candles_;
};

} // namespace pd
