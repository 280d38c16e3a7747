#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling. event_not_found is the routine
 *   "alias not bound yet" condition and is never treated as a hard failure by predicates.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace sase::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  event_not_found = 1001,
  field_not_found = 1002,
  type_mismatch = 2001,
  malformed_expression = 3001,
  invalid_argument = 4001,
  config_invalid = 5001,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "value.field" */
};

constexpr auto to_string(error_code ec) -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::event_not_found: return "event_not_found";
    case error_code::field_not_found: return "field_not_found";
    case error_code::type_mismatch: return "type_mismatch";
    case error_code::malformed_expression: return "malformed_expression";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::config_invalid: return "config_invalid";
    case error_code::internal: return "internal";
  }
  return "unknown";
}

} // namespace sase::core
