#pragma once

/** \file value.hpp
 *  \brief Value expressions: the operands predicates compare.
 *
 * Value expressions are built once by the query compiler and shared read-only by every
 * candidate afterwards. None of them hold mutable state, so value() may run concurrently.
 */

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "sase/error.hpp"
#include "sase/event.hpp"
#include "sase/scalar.hpp"

namespace sase {

/**
 * \brief Abstract value expression interface
 */
class ValueExpr {
public:
    virtual ~ValueExpr() = default;

    /**
     * \brief Resolve against a candidate's binding.
     *
     * Fails with error_code::event_not_found when a referenced alias is not bound yet.
     * Any other failure (missing attribute, malformed expression) uses a different code.
     */
    virtual auto value(const CapturedEvents& evs) const -> std::expected<Scalar, core::error> = 0;

    /** \brief Canonical query text, e.g. "a.x" or "5". */
    virtual auto query_text() const -> std::string = 0;

    /** \brief Aliases read by value(); may be empty and may repeat. */
    virtual auto used_aliases() const -> std::vector<std::string> = 0;

protected:
    ValueExpr() = default;
};

using ValueExprPtr = std::shared_ptr<const ValueExpr>;

/** \brief Attribute access into an aliased event: alias.field */
class FieldValue final : public ValueExpr {
public:
    FieldValue(std::string alias, std::string field);

    auto value(const CapturedEvents& evs) const -> std::expected<Scalar, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

    auto alias() const noexcept -> const std::string& { return alias_; }
    auto field() const noexcept -> const std::string& { return field_; }

private:
    std::string alias_;
    std::string field_;
};

/** \brief A constant. */
class LiteralValue final : public ValueExpr {
public:
    explicit LiteralValue(Scalar v);

    auto value(const CapturedEvents& evs) const -> std::expected<Scalar, core::error> override;
    auto query_text() const -> std::string override;
    auto used_aliases() const -> std::vector<std::string> override;

private:
    Scalar value_;
};

/** \return invalid_argument if alias or field is empty */
auto make_field(std::string alias, std::string field) -> std::expected<ValueExprPtr, core::error>;

auto make_literal(Scalar v) -> ValueExprPtr;

} // namespace sase
