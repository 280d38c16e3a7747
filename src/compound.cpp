#include "sase/compound.hpp"

#include <cstddef>
#include <string_view>
#include <utility>

namespace sase {

namespace {
    auto joined(const std::vector<PredicatePtr>& children, std::string_view sep) -> std::string {
      std::string out = "(";
      for (std::size_t i = 0; i < children.size(); ++i) {
        if (i) out += sep;
        if (children[i]) out += children[i]->query_text();
      }
      out += ')';
      return out;
    }

    auto null_operand(const char* component) -> core::error {
      return core::error{core::error_code::malformed_expression, "null operand", component};
    }

    auto concat_aliases(const std::vector<PredicatePtr>& children) -> std::vector<std::string> {
      std::vector<std::string> out;
      for (const auto& c : children) {
        if (!c) continue;
        auto a = c->used_aliases();
        out.insert(out.end(), a.begin(), a.end());
      }
      return out;
    }
}

AndPredicate::AndPredicate(std::vector<PredicatePtr> children, LoggerPtr logger)
    : Predicate(std::move(logger)), children_(std::move(children)) {}

auto AndPredicate::evaluate_checked(const CapturedEvents& evs) const
    -> std::expected<PredicateResult, core::error> {
  auto acc = PredicateResult::Positive;
  for (const auto& c : children_) {
    if (!c) {
      logger().error("[sase.and_predicate] Null operand in {}", query_text());
      return std::unexpected(null_operand("predicate.and"));
    }
    auto r = c->evaluate_checked(evs);
    if (!r) return r;
    acc = conjoin(acc, *r);
    if (acc == PredicateResult::Negative) break;
  }
  return acc;
}

auto AndPredicate::query_text() const -> std::string { return joined(children_, " AND "); }

auto AndPredicate::used_aliases() const -> std::vector<std::string> { return concat_aliases(children_); }

OrPredicate::OrPredicate(std::vector<PredicatePtr> children, LoggerPtr logger)
    : Predicate(std::move(logger)), children_(std::move(children)) {}

auto OrPredicate::evaluate_checked(const CapturedEvents& evs) const
    -> std::expected<PredicateResult, core::error> {
  auto acc = PredicateResult::Negative;
  for (const auto& c : children_) {
    if (!c) {
      logger().error("[sase.or_predicate] Null operand in {}", query_text());
      return std::unexpected(null_operand("predicate.or"));
    }
    auto r = c->evaluate_checked(evs);
    if (!r) return r;
    acc = disjoin(acc, *r);
    if (acc == PredicateResult::Positive) break;
  }
  return acc;
}

auto OrPredicate::query_text() const -> std::string { return joined(children_, " OR "); }

auto OrPredicate::used_aliases() const -> std::vector<std::string> { return concat_aliases(children_); }

NotPredicate::NotPredicate(PredicatePtr child, LoggerPtr logger)
    : Predicate(std::move(logger)), child_(std::move(child)) {}

auto NotPredicate::evaluate_checked(const CapturedEvents& evs) const
    -> std::expected<PredicateResult, core::error> {
  if (!child_) {
    logger().error("[sase.not_predicate] Null operand in {}", query_text());
    return std::unexpected(null_operand("predicate.not"));
  }
  auto r = child_->evaluate_checked(evs);
  if (!r) return r; // a failed child must not turn into a match
  return negate(*r);
}

auto NotPredicate::query_text() const -> std::string {
  return "NOT (" + (child_ ? child_->query_text() : std::string()) + ")";
}

auto NotPredicate::used_aliases() const -> std::vector<std::string> {
  if (!child_) return {};
  return child_->used_aliases();
}

auto make_and(std::vector<PredicatePtr> children, LoggerPtr logger) -> PredicatePtr {
  return std::make_shared<AndPredicate>(std::move(children), std::move(logger));
}

auto make_or(std::vector<PredicatePtr> children, LoggerPtr logger) -> PredicatePtr {
  return std::make_shared<OrPredicate>(std::move(children), std::move(logger));
}

auto make_not(PredicatePtr child, LoggerPtr logger) -> PredicatePtr {
  return std::make_shared<NotPredicate>(std::move(child), std::move(logger));
}

} // namespace sase
