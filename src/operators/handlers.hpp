#pragma once

/** \file handlers.hpp
 *  \brief Built-in operator handlers (internal).
 *
 * Type-mismatch policy per family:
 *  - $gt/$gte/$lt/$lte: incomparable types -> type_mismatch error (UNDETERMINED)
 *  - $eq/$ne: values of different types never match either operator
 *  - $in/$nin: membership by equality; a non-array operand is invalid_operand
 *  - $regex: values longer than the table's subject limit are invalid_operand
 *  - everything else: a value of the wrong runtime type is a plain non-match
 * Malformed operands are invalid_operand errors except for the logical, range,
 * date and string families, where they are non-matches.
 */

#include "verdict/operator_table.hpp"

namespace verdict::operators {

// comparison.cpp
auto eq(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto ne(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto gt(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto gte(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto lt(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto lte(const value& v, const value& operand, const match_context& ctx) -> operator_result;

// collection.cpp
auto in(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto nin(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto all(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto size(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto exists(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto type(const value& v, const value& operand, const match_context& ctx) -> operator_result;

// pattern.cpp
auto regex(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto elem_match(const value& v, const value& operand, const match_context& ctx) -> operator_result;

// logical.cpp
auto and_(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto or_(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto not_(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto between(const value& v, const value& operand, const match_context& ctx) -> operator_result;

// date.cpp
auto date_before(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto date_after(const value& v, const value& operand, const match_context& ctx) -> operator_result;

// string.cpp
auto contains(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto starts_with(const value& v, const value& operand, const match_context& ctx) -> operator_result;
auto ends_with(const value& v, const value& operand, const match_context& ctx) -> operator_result;

} // namespace verdict::operators
