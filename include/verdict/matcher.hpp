#pragma once

/** \file matcher.hpp
 *  \brief Recursive matching of a single value against an operator map.
 *
 * One function serves top-level fields, $elemMatch elements and the operands
 * of $and/$or/$not, so nested and top-level clauses share the same rules.
 * Clauses are AND-ed. The first clause that signals an error ends matching and
 * the error propagates outward unchanged, through $not included.
 */

#include <expected>

#include "verdict/error.hpp"
#include "verdict/operator_table.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief True for a non-empty object whose keys all start with '$'. */
[[nodiscard]] auto is_operator_map(const value& v) noexcept -> bool;

/** \brief Check every operator name in condition, including those nested in
 *  $elemMatch, $and, $or and $not operands, without looking at any data.
 *
 * \return unknown_operator for the first name absent from the table
 */
auto validate_condition(const value& condition, const OperatorTable& table) -> std::expected<void, core::error>;

/** \brief Match current against condition.
 *
 * An object condition with at least one '$' key (or an empty object) is an
 * operator map; anything else is compared with implicit $eq.
 */
auto match_value(const value& current, const value& condition, const match_context& ctx) -> operator_result;

/** \brief Match a sub-document against a query object (field path -> condition).
 *
 * Paths missing from the sub-document make it a non-match rather than an
 * error; this is how $elemMatch treats array elements.
 */
auto match_document(const value& document, const value::object& query, const match_context& ctx) -> operator_result;

} // namespace verdict
