/**
 * @file test_resilient.cpp
 * @brief Tests for resilient.hpp - per-callback fault isolation.
 */

#include "evr/resilient.hpp"

#include <catch2/catch_test_macros.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using Args = evr::EventArgs;

struct Failure : std::runtime_error {
  explicit Failure(int n) : std::runtime_error("failure"), id(n) {}
  int id;
};

}  // namespace

TEST_CASE("Resilient attempts every callback once", "[resilient]") {
  int calls = 0;
  evr::Handler<Args> thrower([&calls](evr::Sender, const Args&) {
    ++calls;
    throw std::runtime_error("boom");
  });

  auto h = evr::Resilient(evr::Combine({thrower, thrower, thrower}));
  REQUIRE(h.Size() == 3U);

  REQUIRE_NOTHROW(evr::Raise(h, nullptr, Args::Empty()));
  REQUIRE(calls == 3);
}

TEST_CASE("Resilient keeps order and lets healthy callbacks run", "[resilient]") {
  std::vector<int> order;
  evr::Handler<Args> one([&order](evr::Sender, const Args&) { order.push_back(1); });
  evr::Handler<Args> bad([&order](evr::Sender, const Args&) {
    order.push_back(2);
    throw Failure(2);
  });
  evr::Handler<Args> three([&order](evr::Sender, const Args&) { order.push_back(3); });

  auto h = evr::Resilient(evr::Combine({one, bad, three}));
  evr::Raise(h, nullptr, Args::Empty());
  REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Resilient routes faults to the exception handler", "[resilient]") {
  evr::Handler<Args> bad([](evr::Sender, const Args&) { throw Failure(7); });
  evr::Handler<Args> good([](evr::Sender, const Args&) {});
  auto source = bad + good + bad;

  std::vector<const void*> failed_ids;
  std::vector<int> failure_ids;
  auto h = evr::Resilient(source, [&](const evr::Callback<Args>& cb, std::exception_ptr fault) {
    failed_ids.push_back(cb.Id());
    try {
      std::rethrow_exception(fault);
    } catch (const Failure& f) {
      failure_ids.push_back(f.id);
    }
  });

  evr::Raise(h, nullptr, Args::Empty());

  // The handler receives the original callback, not the wrapper.
  const void* bad_id = bad.GetInvocationList()[0].Id();
  REQUIRE(failed_ids == std::vector<const void*>{bad_id, bad_id});
  REQUIRE(failure_ids == std::vector<int>{7, 7});
}

TEST_CASE("Resilient exception handler faults propagate", "[resilient]") {
  evr::Handler<Args> bad([](evr::Sender, const Args&) { throw Failure(1); });
  auto h = evr::Resilient(bad, [](const evr::Callback<Args>&, std::exception_ptr) {
    throw std::logic_error("policy");
  });

  REQUIRE_THROWS_AS(evr::Raise(h, nullptr, Args::Empty()), std::logic_error);
}

TEST_CASE("Resilient of None is None", "[resilient]") {
  evr::Handler<Args> none;
  REQUIRE(evr::Resilient(none).IsNone());
}

TEST_CASE("Resilient preserves receivers", "[resilient]") {
  struct Target {
    void On(evr::Sender, const Args&) { ++hits; }
    int hits = 0;
  } target;

  evr::Handler<Args> h = evr::Callback<Args>(&target, &Target::On);
  auto safe = evr::Resilient(h);
  REQUIRE(safe.GetInvocationList()[0].Receiver() == &target);

  evr::Raise(safe, nullptr, Args::Empty());
  REQUIRE(target.hits == 1);
}

TEST_CASE("Without Resilient the raiser observes the first fault", "[resilient]") {
  int calls = 0;
  evr::Handler<Args> thrower([&calls](evr::Sender, const Args&) {
    ++calls;
    throw Failure(3);
  });

  auto h = evr::Combine({thrower, thrower, thrower});
  REQUIRE_THROWS_AS(evr::Raise(h, nullptr, Args::Empty()), Failure);
  REQUIRE(calls == 1);
}
