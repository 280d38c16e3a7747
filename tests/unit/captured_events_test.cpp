#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "sase/event.hpp"

using namespace sase;

TEST_CASE("event attributes", "[event]") {
  auto ev = make_event("Trade", {{"price", 10.0}, {"sym", std::string("ABC")}});
  REQUIRE(ev->type() == "Trade");

  auto price = ev->attr("price");
  REQUIRE(price.has_value());
  REQUIRE(std::get<double>(*price) == 10.0);

  auto missing = ev->attr("volume");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::field_not_found);
}

TEST_CASE("lookup of an unbound alias is event_not_found", "[event][captured]") {
  CapturedEvents evs;
  REQUIRE(evs.empty());
  auto r = evs.lookup("a");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::event_not_found);
}

TEST_CASE("with() extends a copy and leaves the original alone", "[event][captured]") {
  auto a = make_event("A", {{"x", 1.0}});
  auto b = make_event("B", {{"x", 2.0}});

  CapturedEvents s0;
  auto s1 = s0.with("a", a);
  REQUIRE(s1.has_value());
  auto s2 = s1->with("b", b);
  REQUIRE(s2.has_value());

  REQUIRE(s0.size() == 0);
  REQUIRE(s1->size() == 1);
  REQUIRE(s2->size() == 2);
  REQUIRE_FALSE(s1->contains("b"));
  REQUIRE(s2->aliases() == std::vector<std::string>{"a", "b"});

  auto got = s2->lookup("b");
  REQUIRE(got.has_value());
  REQUIRE(*got == b.get());
}

TEST_CASE("with() rejects bad bindings", "[event][captured]") {
  auto a = make_event("A", {});
  auto s1 = CapturedEvents{}.with("a", a);
  REQUIRE(s1.has_value());

  auto dup = s1->with("a", a);
  REQUIRE_FALSE(dup.has_value());
  REQUIRE(dup.error().code == core::error_code::invalid_argument);

  REQUIRE_FALSE(s1->with("", a).has_value());
  REQUIRE_FALSE(s1->with("b", nullptr).has_value());
}
