#pragma once

/** \file scalar.hpp
 *  \brief Runtime values read out of captured events.
 *
 * A Scalar is a closed tagged union. Equality is structural and defined for every tag;
 * ordering is only defined for numbers, and callers extract the number explicitly via
 * as_number() so a non-numeric operand is reported instead of coerced.
 */

#include <expected>
#include <string>
#include <string_view>
#include <variant>

#include "sase/error.hpp"

namespace sase {

/** \brief Scalar value type; std::monostate is the null value. */
using Scalar = std::variant<std::monostate, double, std::string, bool>;

/** \brief True iff both scalars carry the same tag and equal payloads.
 *
 * Numbers compare with IEEE semantics, so a NaN is never equal to anything, itself included.
 */
auto structurally_equal(const Scalar& a, const Scalar& b) noexcept -> bool;

/** \brief Extract the numeric payload; type_mismatch for any other tag. */
auto as_number(const Scalar& s) -> std::expected<double, core::error>;

/** \brief "null", "number", "string" or "bool". */
auto kind_name(const Scalar& s) noexcept -> std::string_view;

/** \brief Render as a query literal: 5, 10.25, "ten", true, null. */
auto to_query_text(const Scalar& s) -> std::string;

} // namespace sase
