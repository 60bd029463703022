/**
 * @file test_fault.cpp
 * @brief Tests for fault.hpp - AggregateFault, Completion and the fault sink.
 */

#include "evr/fault.hpp"

#include <catch2/catch_test_macros.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct SinkCounter {
  int calls = 0;
  std::exception_ptr last;

  static void Record(const std::exception_ptr& fault, void* ctx) {
    auto* self = static_cast<SinkCounter*>(ctx);
    ++self->calls;
    self->last = fault;
  }
};

}  // namespace

TEST_CASE("DescribeFault", "[fault]") {
  SECTION("std::exception reports what()") {
    auto e = std::make_exception_ptr(std::invalid_argument("bad value"));
    REQUIRE(evr::DescribeFault(e) == "bad value");
  }

  SECTION("non-standard exception") {
    auto e = std::make_exception_ptr(42);
    REQUIRE(evr::DescribeFault(e) == "non-standard exception");
  }

  SECTION("null pointer") {
    REQUIRE(evr::DescribeFault(std::exception_ptr()) == "none");
  }
}

TEST_CASE("AggregateFault carries every fault", "[fault]") {
  std::vector<std::exception_ptr> faults{std::make_exception_ptr(std::runtime_error("a")),
                                         std::make_exception_ptr(std::logic_error("b")),
                                         std::make_exception_ptr(std::runtime_error("c"))};
  evr::AggregateFault agg(faults);

  REQUIRE(agg.Count() == 3U);
  REQUIRE(std::string(agg.what()) == "3 callback(s) failed");
  REQUIRE_THROWS_AS(std::rethrow_exception(agg.Faults()[1]), std::logic_error);

  // Catchable as std::exception.
  bool caught = false;
  try {
    throw agg;
  } catch (const std::exception& e) {
    caught = (std::string(e.what()) == "3 callback(s) failed");
  }
  REQUIRE(caught);
}

TEST_CASE("Unobserved fault sink injection", "[fault]") {
  SinkCounter counter;
  evr::SetUnobservedFaultSink(evr::FaultSink{&SinkCounter::Record, &counter});
  const uint64_t before = evr::UnobservedFaultCount();

  auto e = std::make_exception_ptr(std::runtime_error("lost"));
  evr::ReportUnobservedFault(e);

  REQUIRE(counter.calls == 1);
  REQUIRE(counter.last == e);
  REQUIRE(evr::UnobservedFaultCount() == before + 1U);

  SECTION("reset restores the logging default") {
    evr::ResetUnobservedFaultSink();
    evr::ReportUnobservedFault(e);
    REQUIRE(counter.calls == 1);
    REQUIRE(evr::UnobservedFaultCount() == before + 2U);
  }

  evr::ResetUnobservedFaultSink();
}

TEST_CASE("Observed fault logging toggle", "[fault]") {
  const bool prev = evr::GetLogObservedFaults();
  evr::SetLogObservedFaults(false);
  REQUIRE_FALSE(evr::GetLogObservedFaults());
  evr::SetLogObservedFaults(true);
  REQUIRE(evr::GetLogObservedFaults());
  evr::SetLogObservedFaults(prev);
}

TEST_CASE("Completion Observe returns the fault", "[fault]") {
  auto e = std::make_exception_ptr(std::runtime_error("x"));
  evr::Completion c(e);
  REQUIRE_FALSE(c.IsObserved());
  REQUIRE(c.Observe() == e);
  REQUIRE(c.IsObserved());

  evr::Completion ok;
  REQUIRE(ok.Observe() == nullptr);
}
