#pragma once

/**
 * \file predicate.hpp
 * \brief Three-valued predicates over a partially captured event sequence.
 *
 * The automaton evaluates the predicates guarding a transition each time a candidate's
 * binding grows. A predicate answers Positive or Negative once it can decide, and Uncertain
 * while an alias it reads has no event yet; only Uncertain keeps the transition pending.
 *
 * evaluate() never reports raw errors. Unbound aliases become Uncertain; every other
 * failure (null operand, unresolvable operand, ordering on non-numbers, unknown operator)
 * is logged to the injected logger and becomes Negative, which kills the candidate.
 * evaluate_checked() keeps such failures apart from a plain Negative so that compound
 * predicates propagate them instead of negating or absorbing them.
 *
 * Thread-safety: predicates are immutable after construction and may be evaluated
 * concurrently against independent CapturedEvents snapshots.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "sase/error.hpp"
#include "sase/event.hpp"
#include "sase/value.hpp"

namespace sase {

enum class PredicateResult : std::uint8_t { Positive, Negative, Uncertain };

constexpr auto to_string(PredicateResult r) -> std::string_view {
  switch (r) {
    case PredicateResult::Positive: return "Positive";
    case PredicateResult::Negative: return "Negative";
    case PredicateResult::Uncertain: return "Uncertain";
  }
  return "Invalid";
}

/** \brief Kleene AND: Negative dominates, then Uncertain. */
constexpr auto conjoin(PredicateResult a, PredicateResult b) -> PredicateResult {
  if (a == PredicateResult::Negative || b == PredicateResult::Negative) return PredicateResult::Negative;
  if (a == PredicateResult::Uncertain || b == PredicateResult::Uncertain) return PredicateResult::Uncertain;
  return PredicateResult::Positive;
}

/** \brief Kleene OR: Positive dominates, then Uncertain. */
constexpr auto disjoin(PredicateResult a, PredicateResult b) -> PredicateResult {
  if (a == PredicateResult::Positive || b == PredicateResult::Positive) return PredicateResult::Positive;
  if (a == PredicateResult::Uncertain || b == PredicateResult::Uncertain) return PredicateResult::Uncertain;
  return PredicateResult::Negative;
}

constexpr auto negate(PredicateResult r) -> PredicateResult {
  switch (r) {
    case PredicateResult::Positive: return PredicateResult::Negative;
    case PredicateResult::Negative: return PredicateResult::Positive;
    case PredicateResult::Uncertain: return PredicateResult::Uncertain;
  }
  return PredicateResult::Negative;
}

/** \brief Comparison operators. Eq/Ne work on any scalar, the rest on numbers only. */
enum class Op : std::uint8_t { Eq, Ne, Gt, Lt, Ge, Le };

/** \brief "==", "!=", ">", "<", ">=", "<="; empty for a value outside the enum. */
auto op_symbol(Op op) noexcept -> std::string_view;

/** \brief Inverse of op_symbol, for the query compiler. */
auto parse_op(std::string_view symbol) -> std::expected<Op, core::error>;

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * \brief Abstract predicate interface
 */
class Predicate {
public:
    virtual ~Predicate() = default;

    /** \brief Evaluate against the captured events of one candidate; failures are Negative. */
    auto evaluate(const CapturedEvents& evs) const -> PredicateResult;

    /**
     * \brief Evaluate, reporting a malformed query as an error rather than Negative.
     *
     * The error has already been logged by the predicate that detected it.
     */
    virtual auto evaluate_checked(const CapturedEvents& evs) const
        -> std::expected<PredicateResult, core::error> = 0;

    /** \brief Human-readable query text; never fails. */
    virtual auto query_text() const -> std::string = 0;

    /** \brief Aliases consulted during evaluation, operands in order, not deduplicated. */
    virtual auto used_aliases() const -> std::vector<std::string> = 0;

protected:
    /** A null logger discards diagnostics. */
    explicit Predicate(LoggerPtr logger);

    auto logger() const noexcept -> spdlog::logger& { return *logger_; }

private:
    LoggerPtr logger_;
};

using PredicatePtr = std::shared_ptr<const Predicate>;

/** \brief left <op> right */
class OperatorPredicate final : public Predicate {
public:
    OperatorPredicate(ValueExprPtr left, Op op, ValueExprPtr right, LoggerPtr logger = nullptr);

    auto evaluate_checked(const CapturedEvents& evs) const
        -> std::expected<PredicateResult, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

    auto op() const noexcept -> Op { return op_; }

private:
    struct operands { Scalar left; Scalar right; };

    auto resolve(const CapturedEvents& evs) const -> std::expected<operands, core::error>;
    auto compare_ordered(const Scalar& l, const Scalar& r) const
        -> std::expected<PredicateResult, core::error>;

    ValueExprPtr left_;
    ValueExprPtr right_;
    Op op_;
};

auto make_operator(ValueExprPtr left, Op op, ValueExprPtr right, LoggerPtr logger = nullptr) -> PredicatePtr;

} // namespace sase
