// D6.2: Snapshot hand-off and fake market feed
// Tests:
//   1. Bounded queue drops the oldest entry when full
//   2. drainLatest takes the newest and empties the queue; empty leaves out untouched
//   3. Producer threads vs a polling consumer: sequences only move forward
//   4. FakeMarketFeed::next is deterministic for a seed and keeps candles consistent
//   5. FakeMarketFeed thread delivers snapshots through poll()

#include "pd/data/FakeMarketFeed.hpp"
#include "pd/data/SnapshotQueue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: drop oldest ---
  {
    pd::SnapshotQueue<int> q(3);
    for (int i = 1; i <= 5; i++) q.push(i);
    requireTrue(q.size() == 3, "bounded");
    int v = 0;
    requireTrue(q.pop(v) && v == 3, "oldest two dropped");
    requireTrue(q.pop(v) && v == 4, "fifo");
    requireTrue(q.pop(v) && v == 5, "fifo");
    requireTrue(!q.pop(v), "empty");
    requireTrue(v == 5, "failed pop leaves out untouched");

    pd::SnapshotQueue<int> zero(0);
    zero.push(1);
    zero.push(2);
    requireTrue(zero.size() == 1, "capacity at least 1");
    std::printf("  Test 1 (drop oldest): PASS\n");
  }

  // --- Test 2: drainLatest ---
  {
    pd::SnapshotQueue<int> q(8);
    int v = -1;
    requireTrue(!q.drainLatest(v) && v == -1, "empty drain keeps previous");
    q.push(10);
    q.push(20);
    q.push(30);
    requireTrue(q.drainLatest(v) && v == 30, "newest wins");
    requireTrue(q.size() == 0, "older discarded");
    q.push(40);
    q.clear();
    requireTrue(!q.drainLatest(v) && v == 30, "clear empties");
    std::printf("  Test 2 (drainLatest): PASS\n");
  }

  // --- Test 3: threads ---
  {
    pd::SnapshotQueue<pd::MarketSnapshot> q(4);
    std::atomic<std::uint64_t> nextSeq{1};
    std::atomic<bool> done{false};
    const int kProducers = 3;
    const int kPerProducer = 2000;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; p++) {
      producers.emplace_back([&] {
        for (int i = 0; i < kPerProducer; i++) {
          pd::MarketSnapshot s;
          s.sequence = nextSeq.fetch_add(1);
          s.coins.resize(1);
          q.push(std::move(s));
        }
      });
    }
    std::thread joiner([&] {
      for (auto& t : producers) t.join();
      done.store(true);
    });

    pd::MarketSnapshot latest;
    int drained = 0;
    while (!done.load()) {
      pd::MarketSnapshot s;
      if (q.drainLatest(s)) {
        requireTrue(s.coins.size() == 1, "snapshot intact");
        latest = std::move(s);
        drained++;
      }
    }
    joiner.join();
    pd::MarketSnapshot tail;
    if (q.drainLatest(tail)) latest = std::move(tail);
    requireTrue(q.size() == 0, "queue drained");
    requireTrue(latest.sequence >= 1 &&
                    latest.sequence <= static_cast<std::uint64_t>(kProducers * kPerProducer),
                "sequence in range");
    std::printf("  Test 3 (threads, %d drains): PASS\n", drained);
  }

  // --- Test 4: deterministic feed ---
  {
    pd::FakeMarketFeedConfig cfg;
    cfg.seed = 99;
    cfg.ticksPerCandle = 4;
    cfg.historyCandles = 50;
    cfg.maxCandles = 60;
    pd::FakeMarketFeed a(cfg), b(cfg);

    pd::MarketSnapshot sa, sb;
    for (int i = 0; i < 100; i++) {
      sa = a.next();
      sb = b.next();
    }
    requireTrue(sa.sequence == 100 && sb.sequence == 100, "sequence counts ticks");
    requireTrue(sa.coins.size() == cfg.coins.size(), "one record per coin");
    requireTrue(sa.candles.size() == sa.coins.size(), "parallel candle series");
    for (std::size_t i = 0; i < sa.coins.size(); i++) {
      requireTrue(sa.coins[i].price == sb.coins[i].price, "same seed, same walk");
      requireTrue(sa.coins[i].symbol == cfg.coins[i].symbol, "symbol kept");
      requireTrue(sa.coins[i].price > 0.0, "positive price");
      requireTrue(sa.coins[i].low24h <= sa.coins[i].price &&
                      sa.coins[i].price <= sa.coins[i].high24h,
                  "price within 24h range");

      const auto& series = sa.candles[i];
      requireTrue(series.size() == 60, "capped at maxCandles");
      requireTrue(series.back().close == sa.coins[i].price, "last close is the price");
      for (std::size_t k = 0; k < series.size(); k++) {
        const pd::Candle& c = series[k];
        requireTrue(c.low <= c.open && c.low <= c.close, "low is lowest");
        requireTrue(c.high >= c.open && c.high >= c.close, "high is highest");
        if (k > 0) requireTrue(c.time > series[k - 1].time, "times increase");
      }
    }

    cfg.seed = 100;
    pd::FakeMarketFeed c(cfg);
    pd::MarketSnapshot sc;
    for (int i = 0; i < 100; i++) sc = c.next();
    requireTrue(sc.coins[0].price != sa.coins[0].price, "different seed, different walk");
    std::printf("  Test 4 (deterministic feed): PASS\n");
  }

  // --- Test 5: feed thread ---
  {
    pd::FakeMarketFeedConfig cfg;
    cfg.tickIntervalMs = 5;
    pd::FakeMarketFeed feed(cfg);
    requireTrue(!feed.isRunning(), "idle before start");
    feed.start();
    requireTrue(feed.isRunning(), "running");

    pd::MarketSnapshot snap;
    std::uint64_t lastSeq = 0;
    int received = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (received < 5 && std::chrono::steady_clock::now() < deadline) {
      if (feed.poll(snap)) {
        requireTrue(snap.sequence > lastSeq, "sequence moves forward");
        lastSeq = snap.sequence;
        received++;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    feed.stop();
    requireTrue(!feed.isRunning(), "stopped");
    requireTrue(received >= 2, "snapshots arrived");
    requireTrue(snap.coins.size() == cfg.coins.size(), "full snapshot");
    feed.stop();
    std::printf("  Test 5 (feed thread, %d snapshots): PASS\n", received);
  }

  std::printf("D6.2 snapshot queue: ALL PASS\n");
  return 0;
}
