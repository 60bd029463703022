// Copyright (c) 2024 liudegui. MIT License.
//
// basic_demo.cpp -- evr handler composition walkthrough.
//
// Demonstrates:
//   1. Building handlers from lambdas, free functions and member functions
//   2. Combine and the None identity
//   3. Adapt with a signature mismatch
//   4. Resilient fault isolation vs. plain Raise
//   5. Parallel fan-out with AggregateFault

#include "evr/evr.hpp"

#include <atomic>
#include <cstdio>
#include <stdexcept>

// ============================================================================
// Demo 1: Handler sources
// ============================================================================

static void LogEvent(evr::Sender sender, const evr::EventArgs& /*args*/) {
  printf("  [free]    event from %p\n", sender);
}

struct Panel {
  void OnEvent(evr::Sender /*sender*/, const evr::EventArgs& /*args*/) { printf("  [member]  panel refresh #%d\n", ++refreshes); }
  int refreshes = 0;
};

static void DemoSources() {
  printf("\n=== Demo 1: Handler sources ===\n");
  Panel panel;
  evr::Handler<evr::EventArgs> lambda([](evr::Sender, const evr::EventArgs&) { printf("  [lambda]  called\n"); });
  evr::Handler<evr::EventArgs> member = evr::Callback<evr::EventArgs>(&panel, &Panel::OnEvent);
  evr::Handler<evr::EventArgs> free_fn = evr::ToGeneric(&LogEvent);

  auto all = evr::Combine({lambda, member, free_fn, member});
  printf("  invocation list size: %zu\n", all.Size());
  evr::Raise(all, &panel, evr::EventArgs::Empty());
}

// ============================================================================
// Demo 2: None
// ============================================================================

static void DemoNone() {
  printf("\n=== Demo 2: None ===\n");
  evr::Handler<evr::EventArgs> none;
  evr::Handler<evr::EventArgs> one([](evr::Sender, const evr::EventArgs&) {});
  printf("  None + one == one : %s\n", (none + one) == one ? "yes" : "no");
  printf("  Combine(None, None) is None : %s\n", evr::Combine({none, none}).IsNone() ? "yes" : "no");
  evr::Raise(none, nullptr, evr::EventArgs::Empty());
  printf("  Raise(None) returned without effect\n");
}

// ============================================================================
// Demo 3: Adapt
// ============================================================================

struct Unrelated : evr::EventArgs {};

static void DemoAdapt() {
  printf("\n=== Demo 3: Adapt ===\n");
  auto ok = evr::Adapt<evr::PropertyChangedEventArgs>(&LogEvent);
  printf("  base handler -> PropertyChanged handler: %s\n", ok.has_value() ? "ok" : "mismatch");

  auto bad = evr::Adapt<evr::PropertyChangedEventArgs>([](evr::Sender, const Unrelated&) {});
  if (!bad.has_value()) {
    printf("  incompatible callable rejected, target %s\n", bad.get_error().target_type.c_str());
  }
}

// ============================================================================
// Demo 4: Resilient
// ============================================================================

static void DemoResilient() {
  printf("\n=== Demo 4: Resilient ===\n");
  int calls = 0;
  evr::Handler<evr::EventArgs> flaky([&calls](evr::Sender, const evr::EventArgs&) {
    ++calls;
    throw std::runtime_error("flaky subscriber");
  });
  auto three = evr::Combine({flaky, flaky, flaky});

  try {
    evr::Raise(three, nullptr, evr::EventArgs::Empty());
  } catch (const std::exception& e) {
    printf("  plain Raise: %d call(s), caller saw '%s'\n", calls, e.what());
  }

  calls = 0;
  int reported = 0;
  auto safe = evr::Resilient(three, [&reported](const evr::Callback<evr::EventArgs>&, std::exception_ptr) {
    ++reported;
  });
  evr::Raise(safe, nullptr, evr::EventArgs::Empty());
  printf("  Resilient Raise: %d call(s), %d fault(s) reported\n", calls, reported);
}

// ============================================================================
// Demo 5: Parallel
// ============================================================================

static void DemoParallel() {
  printf("\n=== Demo 5: Parallel ===\n");
  std::atomic<int> done{0};
  evr::Handler<evr::EventArgs> work([&done](evr::Sender, const evr::EventArgs&) { done.fetch_add(1); });
  evr::Handler<evr::EventArgs> fail([](evr::Sender, const evr::EventArgs&) { throw std::runtime_error("worker"); });

  auto fan = evr::Parallel(evr::Combine({work, fail, work, fail, work}));
  try {
    evr::Raise(fan, nullptr, evr::EventArgs::Empty());
  } catch (const evr::AggregateFault& agg) {
    printf("  %d unit(s) succeeded, %s\n", done.load(), agg.what());
  }

  auto stats = evr::TaskPool::Default().GetStats();
  printf("  default pool: submitted=%lu processed=%lu stolen=%lu\n", static_cast<unsigned long>(stats.submitted),
         static_cast<unsigned long>(stats.processed), static_cast<unsigned long>(stats.stolen));
}

int main() {
  evr::log::Init();
  evr::log::SetLevel(evr::log::Level::kInfo);

  DemoSources();
  DemoNone();
  DemoAdapt();
  DemoResilient();
  DemoParallel();

  evr::log::Shutdown();
  return 0;
}
