#include "handlers.hpp"

#include <regex>
#include <string>

#include "verdict/matcher.hpp"

namespace verdict::operators {

// Search semantics: "^admin" anchors, "admin" matches anywhere in the value.
auto regex(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  if (!operand.is_string()) {
    return std::unexpected(core::error{
        core::error_code::invalid_operand, "$regex expects a pattern string", "operators.regex"});
  }
  auto compiled = ctx.table.patterns().get_or_compile(operand.as_string());
  if (!compiled) return std::unexpected(compiled.error());
  if (!v.is_string()) return false;
  // std::regex backtracks recursively; long subjects exhaust the stack.
  const auto limit = ctx.table.regex_subject_limit();
  if (v.as_string().size() > limit) {
    return std::unexpected(core::error{
        core::error_code::invalid_operand,
        "Value too long for $regex: " + std::to_string(v.as_string().size()) + " characters (limit " +
            std::to_string(limit) + ")",
        "operators.regex"});
  }
  return std::regex_search(v.as_string(), **compiled);
}

// An operator-map operand ({"$gte": 80}) applies to each element directly;
// any other object operand is a query over object elements.
auto elem_match(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  if (!operand.is_object()) {
    return std::unexpected(core::error{
        core::error_code::invalid_operand, "$elemMatch expects a query object", "operators.elemMatch"});
  }
  if (!v.is_array()) return false;

  const bool per_value = is_operator_map(operand);
  for (const auto& element : v.as_array()) {
    operator_result r = false;
    if (per_value) {
      r = match_value(element, operand, ctx);
    } else if (element.is_object()) {
      r = match_document(element, operand.as_object(), ctx);
    }
    if (!r) return r;
    if (*r) return true;
  }
  return false;
}

} // namespace verdict::operators
