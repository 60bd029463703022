/**
 * @file test_task_pool.cpp
 * @brief Catch2 tests for evr::TaskPool.
 */

#include "evr/task_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

evr::TaskPoolConfig Config(uint32_t workers) {
  evr::TaskPoolConfig cfg;
  cfg.name = "test";
  cfg.worker_num = workers;
  return cfg;
}

/// Spins until @p pred holds or ~2 s elapse.
template <typename Pred>
bool WaitFor(Pred pred) {
  for (int i = 0; i < 2000; ++i) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace

// ============================================================================
// Construction / lifecycle
// ============================================================================

TEST_CASE("TaskPool construction and config", "[task_pool]") {
  SECTION("custom worker count is respected") {
    evr::TaskPool pool(Config(4U));
    REQUIRE(pool.WorkerCount() == 4U);
    REQUIRE_FALSE(pool.IsRunning());
    REQUIRE(std::string(pool.Name()) == "test");
  }

  SECTION("zero worker_num selects hardware concurrency") {
    evr::TaskPool pool(Config(0U));
    REQUIRE(pool.WorkerCount() >= 1U);
  }
}

TEST_CASE("TaskPool Start and Shutdown", "[task_pool]") {
  evr::TaskPool pool(Config(2U));

  pool.Start();
  REQUIRE(pool.IsRunning());
  pool.Start();  // no-op
  REQUIRE(pool.IsRunning());

  pool.Shutdown();
  REQUIRE_FALSE(pool.IsRunning());
  pool.Shutdown();  // no-op

  SECTION("restart after shutdown") {
    pool.Start();
    std::promise<void> ran;
    REQUIRE(pool.Submit([&ran] { ran.set_value(); }));
    REQUIRE(ran.get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    pool.Shutdown();
  }
}

// ============================================================================
// Submit
// ============================================================================

TEST_CASE("TaskPool Submit runs every task", "[task_pool]") {
  evr::TaskPool pool(Config(3U));
  pool.Start();

  std::atomic<int> count{0};
  for (int i = 0; i < 100; ++i) {
    REQUIRE(pool.Submit([&count] { count.fetch_add(1); }));
  }
  REQUIRE(WaitFor([&count] { return count.load() == 100; }));

  pool.Shutdown();
  auto stats = pool.GetStats();
  REQUIRE(stats.submitted == 100U);
  REQUIRE(stats.processed == 100U);
  REQUIRE(stats.rejected == 0U);
}

TEST_CASE("TaskPool rejects tasks when not running", "[task_pool]") {
  evr::TaskPool pool(Config(1U));
  bool ran = false;
  REQUIRE_FALSE(pool.Submit([&ran] { ran = true; }));
  REQUIRE_FALSE(ran);
  REQUIRE(pool.GetStats().rejected == 1U);
}

TEST_CASE("TaskPool Shutdown drains queued tasks", "[task_pool]") {
  evr::TaskPool pool(Config(1U));
  pool.Start();

  std::atomic<int> count{0};
  for (int i = 0; i < 50; ++i) {
    pool.Submit([&count] {
      std::this_thread::sleep_for(std::chrono::microseconds(100));
      count.fetch_add(1);
    });
  }
  pool.Shutdown();
  REQUIRE(count.load() == 50);
}

TEST_CASE("TaskPool survives throwing tasks", "[task_pool]") {
  struct Counter {
    static void Sink(const std::exception_ptr&, void* ctx) { static_cast<std::atomic<int>*>(ctx)->fetch_add(1); }
  };
  std::atomic<int> reported{0};
  evr::SetUnobservedFaultSink(evr::FaultSink{&Counter::Sink, &reported});

  evr::TaskPool pool(Config(1U));
  pool.Start();
  pool.Submit([] { throw std::runtime_error("task"); });
  std::atomic<bool> after{false};
  pool.Submit([&after] { after.store(true); });
  pool.Shutdown();

  evr::ResetUnobservedFaultSink();
  REQUIRE(reported.load() == 1);
  REQUIRE(after.load());
}

TEST_CASE("TaskPool IsWorkerThread", "[task_pool]") {
  evr::TaskPool pool(Config(1U));
  pool.Start();

  REQUIRE_FALSE(pool.IsWorkerThread());
  std::promise<bool> inside;
  pool.Submit([&] { inside.set_value(pool.IsWorkerThread()); });
  REQUIRE(inside.get_future().get());
  pool.Shutdown();
}

// ============================================================================
// FanOut
// ============================================================================

TEST_CASE("TaskPool FanOut runs each unit once and collects faults", "[task_pool]") {
  evr::TaskPool pool(Config(2U));
  pool.Start();

  std::vector<std::atomic<int>> hits(8);
  std::vector<evr::TaskPool::Task> units;
  for (size_t i = 0; i < hits.size(); ++i) {
    units.emplace_back([&hits, i] {
      hits[i].fetch_add(1);
      if (i % 4 == 0) throw std::runtime_error("unit");
    });
  }

  auto faults = pool.FanOut(std::move(units));
  for (auto& h : hits) {
    REQUIRE(h.load() == 1);
  }
  REQUIRE(faults.size() == 2U);
  pool.Shutdown();
}

TEST_CASE("TaskPool FanOut with an empty batch", "[task_pool]") {
  evr::TaskPool pool(Config(1U));
  REQUIRE(pool.FanOut({}).empty());
}

TEST_CASE("TaskPool FanOut from inside a worker", "[task_pool]") {
  evr::TaskPool pool(Config(1U));
  pool.Start();

  std::promise<int> total;
  pool.Submit([&] {
    std::atomic<int> n{0};
    std::vector<evr::TaskPool::Task> units(4, [&n] { n.fetch_add(1); });
    (void)pool.FanOut(std::move(units));
    total.set_value(n.load());
  });

  auto f = total.get_future();
  REQUIRE(f.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  REQUIRE(f.get() == 4);
  pool.Shutdown();
}

// ============================================================================
// Default pool
// ============================================================================

TEST_CASE("TaskPool Default is started and configured once", "[task_pool]") {
  evr::TaskPool& pool = evr::TaskPool::Default();
  REQUIRE(pool.IsRunning());
  REQUIRE(&pool == &evr::TaskPool::Default());

  // Too late once the pool exists.
  REQUIRE_FALSE(evr::TaskPool::ConfigureDefault(Config(2U)));

  std::promise<void> ran;
  REQUIRE(pool.Submit([&ran] { ran.set_value(); }));
  REQUIRE(ran.get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);
}
