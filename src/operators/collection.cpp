#include "handlers.hpp"

#include <algorithm>
#include <string>

namespace verdict::operators {

namespace {

auto invalid(std::string message) -> operator_result {
  return std::unexpected(core::error{core::error_code::invalid_operand, std::move(message), "operators.collection"});
}

auto member_of(const value& v, const value::array& list) -> bool {
  return std::any_of(list.begin(), list.end(), [&](const value& item) { return item == v; });
}

} // namespace

auto in(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_array()) return invalid("$in expects an array operand");
  return member_of(v, operand.as_array());
}

auto nin(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_array()) return invalid("$nin expects an array operand");
  return !member_of(v, operand.as_array());
}

// Set containment: duplicates in the operand need only one match each.
auto all(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_array()) return invalid("$all expects an array operand");
  if (!v.is_array()) return false;
  const auto& haystack = v.as_array();
  for (const auto& needle : operand.as_array()) {
    if (!member_of(needle, haystack)) return false;
  }
  return true;
}

auto size(const value& v, const value& operand, const match_context&) -> operator_result {
  auto n = operand.as_integer();
  if (!n || *n < 0) return invalid("$size expects a non-negative integer operand");
  if (!v.is_array()) return false;
  return static_cast<std::int64_t>(v.as_array().size()) == *n;
}

// Only called for resolved fields, so presence is always true here.
auto exists(const value&, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_bool()) return invalid("$exists expects a boolean operand");
  return operand.as_bool();
}

auto type(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_string()) return invalid("$type expects a type name string");
  auto t = parse_type_name(operand.as_string());
  if (!t) return invalid("$type: unknown type name '" + operand.as_string() + "'");
  return v.type() == *t;
}

} // namespace verdict::operators
