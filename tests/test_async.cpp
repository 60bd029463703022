/**
 * @file test_async.cpp
 * @brief Tests for async.hpp - Async decorator, Completion and RaiseAsync.
 */

#include "evr/async.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using Args = evr::EventArgs;
using Changed = evr::PropertyChangedEventArgs;
using std::chrono::milliseconds;

evr::TaskPoolConfig PoolConfig() {
  evr::TaskPoolConfig cfg;
  cfg.name = "async";
  cfg.worker_num = 2U;
  return cfg;
}

/// Captures faults delivered to the unobserved sink.
struct SinkProbe {
  std::mutex mtx;
  std::promise<std::string> first;
  bool delivered = false;

  static void Deliver(const std::exception_ptr& fault, void* ctx) {
    auto* self = static_cast<SinkProbe*>(ctx);
    std::lock_guard<std::mutex> lk(self->mtx);
    if (!self->delivered) {
      self->delivered = true;
      self->first.set_value(std::string(evr::DescribeFault(fault).c_str()));
    }
  }
};

/// Installs a SinkProbe for the lifetime of the guard.
class ScopedSink {
 public:
  explicit ScopedSink(SinkProbe& probe) { evr::SetUnobservedFaultSink(evr::FaultSink{&SinkProbe::Deliver, &probe}); }
  ~ScopedSink() { evr::ResetUnobservedFaultSink(); }

  ScopedSink(const ScopedSink&) = delete;
  ScopedSink& operator=(const ScopedSink&) = delete;
};

}  // namespace

// ============================================================================
// Async
// ============================================================================

TEST_CASE("Async returns before the handler runs", "[async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  std::promise<void> ran;
  evr::Handler<Args> blocking([opened, &ran](evr::Sender, const Args&) {
    opened.wait();
    ran.set_value();
  });

  auto h = evr::Async(blocking, evr::ObserveAndDiscard, pool);
  REQUIRE_FALSE(h.IsNone());

  // Would never return if the handler ran on this thread.
  evr::Raise(h, nullptr, Args::Empty());
  gate.set_value();
  REQUIRE(ran.get_future().wait_for(milliseconds(2000)) == std::future_status::ready);
  pool.Shutdown();
}

TEST_CASE("Async continuation receives the outcome", "[async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  SECTION("success") {
    std::promise<bool> outcome;
    evr::Handler<Args> ok([](evr::Sender, const Args&) {});
    auto h = evr::Async(ok, [&outcome](evr::Completion& c) { outcome.set_value(c.IsFaulted()); }, pool);

    evr::Raise(h, nullptr, Args::Empty());
    auto f = outcome.get_future();
    REQUIRE(f.wait_for(milliseconds(2000)) == std::future_status::ready);
    REQUIRE_FALSE(f.get());
  }

  SECTION("fault") {
    std::promise<std::string> outcome;
    evr::Handler<Args> bad([](evr::Sender, const Args&) { throw std::runtime_error("async boom"); });
    auto h = evr::Async(
        bad,
        [&outcome](evr::Completion& c) {
          if (!c.IsFaulted() || c.IsObserved()) {
            outcome.set_value(std::string("unexpected state"));
            return;
          }
          outcome.set_value(std::string(evr::DescribeFault(c.Observe()).c_str()));
        },
        pool);

    evr::Raise(h, nullptr, Args::Empty());
    auto f = outcome.get_future();
    REQUIRE(f.wait_for(milliseconds(2000)) == std::future_status::ready);
    REQUIRE(f.get() == "async boom");
  }

  pool.Shutdown();
}

TEST_CASE("Async default continuation observes the fault", "[async]") {
  SinkProbe probe;
  ScopedSink guard(probe);
  const uint64_t before = evr::UnobservedFaultCount();

  {
    evr::TaskPool pool(PoolConfig());
    pool.Start();
    evr::Handler<Args> bad([](evr::Sender, const Args&) { throw std::runtime_error("quiet"); });
    evr::Raise(evr::Async(bad, evr::ObserveAndDiscard, pool), nullptr, Args::Empty());
    // Shutdown drains the queued unit.
    pool.Shutdown();
  }

  REQUIRE(evr::UnobservedFaultCount() == before);
  REQUIRE_FALSE(probe.delivered);
}

TEST_CASE("Async unobserved fault reaches the sink", "[async]") {
  SinkProbe probe;
  ScopedSink guard(probe);
  auto delivered = probe.first.get_future();

  evr::TaskPool pool(PoolConfig());
  pool.Start();

  SECTION("continuation ignores the fault") {
    evr::Handler<Args> bad([](evr::Sender, const Args&) { throw std::runtime_error("ignored"); });
    evr::Raise(evr::Async(bad, [](evr::Completion&) {}, pool), nullptr, Args::Empty());
    REQUIRE(delivered.wait_for(milliseconds(2000)) == std::future_status::ready);
    REQUIRE(delivered.get() == "ignored");
  }

  SECTION("empty continuation") {
    evr::Handler<Args> bad([](evr::Sender, const Args&) { throw std::runtime_error("no continuation"); });
    evr::Raise(evr::Async(bad, evr::Continuation(), pool), nullptr, Args::Empty());
    REQUIRE(delivered.wait_for(milliseconds(2000)) == std::future_status::ready);
    REQUIRE(delivered.get() == "no continuation");
  }

  SECTION("continuation throws") {
    evr::Handler<Args> ok([](evr::Sender, const Args&) {});
    evr::Raise(evr::Async(ok, [](evr::Completion&) { throw std::logic_error("continuation failed"); }, pool),
               nullptr, Args::Empty());
    REQUIRE(delivered.wait_for(milliseconds(2000)) == std::future_status::ready);
    REQUIRE(delivered.get() == "continuation failed");
  }

  pool.Shutdown();
}

TEST_CASE("Async copies the event args", "[async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  std::promise<std::string> seen;
  evr::Handler<Changed> h([opened, &seen](evr::Sender, const Changed& args) {
    opened.wait();
    seen.set_value(args.property_name);
  });

  {
    auto args = std::make_unique<Changed>("Volume");
    evr::Raise(evr::Async(h, evr::ObserveAndDiscard, pool), nullptr, *args);
  }  // raiser's args destroyed before the handler reads them
  gate.set_value();

  auto f = seen.get_future();
  REQUIRE(f.wait_for(milliseconds(2000)) == std::future_status::ready);
  REQUIRE(f.get() == "Volume");
  pool.Shutdown();
}

TEST_CASE("Async of None still runs the continuation", "[async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  std::promise<bool> outcome;
  auto h = evr::Async(evr::Handler<Args>(), [&outcome](evr::Completion& c) { outcome.set_value(c.IsFaulted()); },
                      pool);
  REQUIRE_FALSE(h.IsNone());

  evr::Raise(h, nullptr, Args::Empty());
  auto f = outcome.get_future();
  REQUIRE(f.wait_for(milliseconds(2000)) == std::future_status::ready);
  REQUIRE_FALSE(f.get());
  pool.Shutdown();
}

TEST_CASE("Async on a stopped pool runs inline", "[async]") {
  evr::TaskPool pool(PoolConfig());

  int calls = 0;
  bool continued = false;
  evr::Handler<Args> h([&calls](evr::Sender, const Args&) { ++calls; });
  evr::Raise(evr::Async(h, [&continued](evr::Completion&) { continued = true; }, pool), nullptr, Args::Empty());

  REQUIRE(calls == 1);
  REQUIRE(continued);
}

// ============================================================================
// RaiseAsync
// ============================================================================

TEST_CASE("RaiseAsync completes the future", "[async][raise_async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  std::atomic<int> calls{0};
  evr::Handler<Args> h([&calls](evr::Sender, const Args&) { calls.fetch_add(1); });

  std::future<void> done = evr::RaiseAsync(h + h, nullptr, Args::Empty(), pool);
  REQUIRE(done.wait_for(milliseconds(2000)) == std::future_status::ready);
  REQUIRE_NOTHROW(done.get());
  REQUIRE(calls.load() == 2);
  pool.Shutdown();
}

TEST_CASE("RaiseAsync surfaces the fault through get", "[async][raise_async]") {
  evr::TaskPool pool(PoolConfig());
  pool.Start();

  evr::Handler<Args> bad([](evr::Sender, const Args&) { throw std::runtime_error("raise async"); });
  std::future<void> done = evr::RaiseAsync(bad, nullptr, Args::Empty(), pool);
  REQUIRE(done.wait_for(milliseconds(2000)) == std::future_status::ready);
  REQUIRE_THROWS_AS(done.get(), std::runtime_error);
  pool.Shutdown();
}

TEST_CASE("RaiseAsync of None is ready with success", "[async][raise_async]") {
  std::future<void> done = evr::RaiseAsync(evr::Handler<Args>(), nullptr, Args::Empty());
  REQUIRE(done.wait_for(milliseconds(2000)) == std::future_status::ready);
  REQUIRE_NOTHROW(done.get());
}

// ============================================================================
// Completion
// ============================================================================

TEST_CASE("Completion observation", "[async][completion]") {
  SECTION("success") {
    evr::Completion c;
    REQUIRE_FALSE(c.IsFaulted());
    REQUIRE_NOTHROW(c.Rethrow());
    REQUIRE(c.IsObserved());
  }

  SECTION("fault peek does not observe") {
    evr::Completion c(std::make_exception_ptr(std::runtime_error("x")));
    REQUIRE(c.IsFaulted());
    REQUIRE(c.Fault() != nullptr);
    REQUIRE_FALSE(c.IsObserved());
  }

  SECTION("rethrow observes") {
    evr::Completion c(std::make_exception_ptr(std::runtime_error("x")));
    REQUIRE_THROWS_AS(c.Rethrow(), std::runtime_error);
    REQUIRE(c.IsObserved());
  }
}
