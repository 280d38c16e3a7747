#pragma once

/** \file compound.hpp
 *  \brief Boolean combinations of predicates under Kleene three-valued logic.
 *
 * and([]) == Positive, or([]) == Negative. A malformed child (null, or one whose
 * evaluate_checked() fails) makes the whole combination fail, so the candidate is killed
 * even under NOT or inside an OR with a matching sibling.
 */

#include <string>
#include <vector>

#include "sase/predicate.hpp"

namespace sase {

class AndPredicate final : public Predicate {
public:
    explicit AndPredicate(std::vector<PredicatePtr> children, LoggerPtr logger = nullptr);

    auto evaluate_checked(const CapturedEvents& evs) const
        -> std::expected<PredicateResult, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

private:
    std::vector<PredicatePtr> children_;
};

class OrPredicate final : public Predicate {
public:
    explicit OrPredicate(std::vector<PredicatePtr> children, LoggerPtr logger = nullptr);

    auto evaluate_checked(const CapturedEvents& evs) const
        -> std::expected<PredicateResult, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

private:
    std::vector<PredicatePtr> children_;
};

class NotPredicate final : public Predicate {
public:
    explicit NotPredicate(PredicatePtr child, LoggerPtr logger = nullptr);

    auto evaluate_checked(const CapturedEvents& evs) const
        -> std::expected<PredicateResult, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

private:
    PredicatePtr child_;
};

auto make_and(std::vector<PredicatePtr> children, LoggerPtr logger = nullptr) -> PredicatePtr;
auto make_or(std::vector<PredicatePtr> children, LoggerPtr logger = nullptr) -> PredicatePtr;
auto make_not(PredicatePtr child, LoggerPtr logger = nullptr) -> PredicatePtr;

} // namespace sase
