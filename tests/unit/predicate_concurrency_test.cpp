#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "sase/compound.hpp"
#include "tests/support/predicate_fixtures.hpp"

using namespace sase;
using predicate_fixtures::field;
using predicate_fixtures::log_capture;
using predicate_fixtures::num;

TEST_CASE("shared predicates evaluate concurrently against per-candidate snapshots", "[predicate][concurrency]") {
  log_capture log;
  // a.x > 5 AND b.x == a.x AND b.tag < 1  (the last conjunct always logs: tag is a string)
  auto p = make_and({make_operator(field("a", "x"), Op::Gt, num(5), log.logger()),
                     make_operator(field("b", "x"), Op::Eq, field("a", "x"), log.logger()),
                     make_operator(field("b", "tag"), Op::Lt, num(1), log.logger())},
                    log.logger());

  constexpr int kThreads = 8;
  constexpr int kIters = 500;
  std::atomic<int> mismatches{0};
  std::vector<std::thread> workers;
  workers.reserve(kThreads);

  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kIters; ++i) {
        const double x = static_cast<double>((t * kIters + i) % 11);
        CapturedEvents s0;
        auto s1 = s0.with("a", make_event("A", {{"x", x}})).value();
        auto s2 = s1.with("b", make_event("B", {{"x", x}, {"tag", std::string("t")}})).value();

        const auto want1 = x > 5 ? PredicateResult::Uncertain : PredicateResult::Negative;
        if (p->evaluate(s0) != PredicateResult::Uncertain) ++mismatches;
        if (p->evaluate(s1) != want1) ++mismatches;
        if (p->evaluate(s2) != PredicateResult::Negative) ++mismatches;
      }
    });
  }
  for (auto& w : workers) w.join();

  REQUIRE(mismatches.load() == 0);
  REQUIRE(log.text().find("non-numbers") != std::string::npos);
}
