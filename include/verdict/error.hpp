#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 * - Evaluation codes (6xxx) classify why a predicate ended up UNDETERMINED.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace verdict::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  precondition_failed = 4001,
  missing_data = 6001,       /**< field path did not resolve */
  unknown_operator = 6002,   /**< operator name absent from the table */
  type_mismatch = 6003,      /**< value/operand runtime types are incompatible */
  invalid_operand = 6004,    /**< malformed pattern, wrong arity, bad $exists operand, ... */
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "operators.regex" */
};

/** \brief Stable lowercase name of an error code, e.g. "unknown_operator". */
auto to_string(error_code code) noexcept -> std::string_view;

} // namespace verdict::core
