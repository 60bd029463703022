// Copyright (c) 2024 liudegui. MIT License.
//
// async_demo.cpp -- background raising with Async and RaiseAsync.
//
// Usage: async_demo [config.ini|config.json|config.yaml]
//
// An optional config file sets the log level, the default pool and the
// observed-fault logging policy (see evr/config.hpp).

#include "evr/evr.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <stdexcept>
#include <thread>

static void LoadSettings(const char* path) {
  evr::Config<evr::IniBackend, evr::JsonBackend, evr::YamlBackend> cfg;
  auto loaded = cfg.LoadFile(path);
  if (!loaded.has_value()) {
    EVR_LOG_WARN("Demo", "cannot load %s (error %d), using defaults", path, static_cast<int>(loaded.get_error()));
    return;
  }
  auto rc = evr::LoadRuntimeConfig(cfg);
  if (!rc.has_value()) {
    EVR_LOG_WARN("Demo", "invalid settings in %s, using defaults", path);
    return;
  }
  (void)evr::ApplyRuntimeConfig(rc.value());
  EVR_LOG_INFO("Demo", "settings loaded from %s", path);
}

static void CountUnobserved(const std::exception_ptr& fault, void* ctx) {
  auto* counter = static_cast<std::atomic<int>*>(ctx);
  counter->fetch_add(1);
  printf("  [sink]    unobserved: %s\n", evr::DescribeFault(fault).c_str());
}

int main(int argc, char* argv[]) {
  evr::log::Init();
  if (argc > 1) {
    LoadSettings(argv[1]);
  }

  std::atomic<int> unobserved{0};
  evr::SetUnobservedFaultSink(evr::FaultSink{&CountUnobserved, &unobserved});

  evr::Handler<evr::EventArgs> slow([](evr::Sender, const evr::EventArgs&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    printf("  [slow]    finished on worker\n");
  });
  evr::Handler<evr::EventArgs> failing([](evr::Sender, const evr::EventArgs&) {
    throw std::runtime_error("disk full");
  });

  printf("\n=== Async with default continuation ===\n");
  auto t0 = std::chrono::steady_clock::now();
  evr::Raise(evr::Async(slow + failing), nullptr, evr::EventArgs::Empty());
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();
  printf("  Raise returned after %lld us\n", static_cast<long long>(us));

  printf("\n=== Async with a reporting continuation ===\n");
  std::promise<void> reported;
  evr::Raise(evr::Async(failing,
                        [&reported](evr::Completion& c) {
                          if (c.IsFaulted()) {
                            printf("  [cont]    fault: %s\n", evr::DescribeFault(c.Observe()).c_str());
                          }
                          reported.set_value();
                        }),
             nullptr, evr::EventArgs::Empty());
  reported.get_future().wait();

  printf("\n=== Async with an ignoring continuation ===\n");
  std::promise<void> ignored;
  evr::Raise(evr::Async(failing, [&ignored](evr::Completion&) { ignored.set_value(); }), nullptr,
             evr::EventArgs::Empty());
  ignored.get_future().wait();

  printf("\n=== RaiseAsync ===\n");
  std::future<void> done = evr::RaiseAsync(slow + failing, nullptr, evr::EventArgs::Empty());
  try {
    done.get();
  } catch (const std::exception& e) {
    printf("  [future]  get() rethrew: %s\n", e.what());
  }

  evr::TaskPool::Default().Shutdown();
  printf("\nunobserved faults: %d\n", unobserved.load());
  evr::ResetUnobservedFaultSink();
  evr::log::Shutdown();
  return 0;
}
