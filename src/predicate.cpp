#include "sase/predicate.hpp"
#include "sase/diagnostics.hpp"

#include <utility>

namespace sase {

namespace {
    struct op_entry { Op op; std::string_view symbol; };

    constexpr op_entry kOps[] = {
        {Op::Eq, "=="}, {Op::Ne, "!="}, {Op::Gt, ">"},
        {Op::Lt, "<"},  {Op::Ge, ">="}, {Op::Le, "<="},
    };
}

auto op_symbol(Op op) noexcept -> std::string_view {
  for (const auto& e : kOps) if (e.op == op) return e.symbol;
  return {};
}

auto parse_op(std::string_view symbol) -> std::expected<Op, core::error> {
  for (const auto& e : kOps) if (e.symbol == symbol) return e.op;
  return std::unexpected(core::error{
      core::error_code::invalid_argument, "unknown operator '" + std::string(symbol) + "'", "predicate.parse_op"});
}

Predicate::Predicate(LoggerPtr logger)
    : logger_(logger ? std::move(logger) : discard_logger()) {}

auto Predicate::evaluate(const CapturedEvents& evs) const -> PredicateResult {
  auto r = evaluate_checked(evs);
  if (!r) return PredicateResult::Negative; // malformed: terminate this candidate
  return *r;
}

OperatorPredicate::OperatorPredicate(ValueExprPtr left, Op op, ValueExprPtr right, LoggerPtr logger)
    : Predicate(std::move(logger)), left_(std::move(left)), right_(std::move(right)), op_(op) {}

auto OperatorPredicate::resolve(const CapturedEvents& evs) const -> std::expected<operands, core::error> {
  if (!left_ || !right_) {
    return std::unexpected(core::error{
        core::error_code::malformed_expression, "left and right must not be null", "predicate.operator"});
  }
  auto l = left_->value(evs);
  if (!l) return std::unexpected(l.error());
  auto r = right_->value(evs);
  if (!r) return std::unexpected(r.error());
  return operands{std::move(*l), std::move(*r)};
}

auto OperatorPredicate::evaluate_checked(const CapturedEvents& evs) const
    -> std::expected<PredicateResult, core::error> {
  auto vals = resolve(evs);
  if (!vals) {
    if (vals.error().code == core::error_code::event_not_found) {
      return PredicateResult::Uncertain; // retry once more events are captured
    }
    logger().error("[sase.operator_predicate] Could not evaluate {} left/right: {}",
                   query_text(), vals.error().message);
    return std::unexpected(std::move(vals.error()));
  }

  switch (op_) {
    case Op::Eq:
      return structurally_equal(vals->left, vals->right) ? PredicateResult::Positive : PredicateResult::Negative;
    case Op::Ne:
      return structurally_equal(vals->left, vals->right) ? PredicateResult::Negative : PredicateResult::Positive;
    case Op::Gt:
    case Op::Lt:
    case Op::Ge:
    case Op::Le:
      return compare_ordered(vals->left, vals->right);
  }

  logger().error("[sase.operator_predicate] Unhandled op {} for {}",
                 static_cast<unsigned>(op_), query_text());
  return std::unexpected(core::error{
      core::error_code::internal, "unhandled operator", "predicate.operator"});
}

auto OperatorPredicate::compare_ordered(const Scalar& l, const Scalar& r) const
    -> std::expected<PredicateResult, core::error> {
  auto lhs = as_number(l);
  auto rhs = as_number(r);
  if (!lhs || !rhs) {
    logger().error("[sase.operator_predicate] Could not compare {} for non-numbers ({} {} {}): {}",
                   op_symbol(op_), kind_name(l), op_symbol(op_), kind_name(r), query_text());
    return std::unexpected(lhs ? rhs.error() : lhs.error());
  }

  // Built-in comparisons: every ordering involving NaN is false.
  bool holds = false;
  switch (op_) {
    case Op::Gt: holds = *lhs > *rhs; break;
    case Op::Lt: holds = *lhs < *rhs; break;
    case Op::Ge: holds = *lhs >= *rhs; break;
    case Op::Le: holds = *lhs <= *rhs; break;
    default: break;
  }
  return holds ? PredicateResult::Positive : PredicateResult::Negative;
}

auto OperatorPredicate::query_text() const -> std::string {
  std::string out;
  if (left_) out += left_->query_text();
  out += ' ';
  out += op_symbol(op_);
  if (right_) {
    out += ' ';
    out += right_->query_text();
  }
  return out;
}

auto OperatorPredicate::used_aliases() const -> std::vector<std::string> {
  std::vector<std::string> out;
  if (left_) {
    auto l = left_->used_aliases();
    out.insert(out.end(), l.begin(), l.end());
  }
  if (right_) {
    auto r = right_->used_aliases();
    out.insert(out.end(), r.begin(), r.end());
  }
  return out;
}

auto make_operator(ValueExprPtr left, Op op, ValueExprPtr right, LoggerPtr logger) -> PredicatePtr {
  return std::make_shared<OperatorPredicate>(std::move(left), op, std::move(right), std::move(logger));
}

} // namespace sase
