#include "handlers.hpp"

#include <algorithm>

namespace verdict::operators {

auto contains(const value& v, const value& operand, const match_context&) -> operator_result {
  if (v.is_string()) {
    if (!operand.is_string()) return false;
    return v.as_string().find(operand.as_string()) != std::string::npos;
  }
  if (v.is_array()) {
    const auto& items = v.as_array();
    return std::any_of(items.begin(), items.end(), [&](const value& item) { return item == operand; });
  }
  return false;
}

auto starts_with(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!v.is_string() || !operand.is_string()) return false;
  return v.as_string().starts_with(operand.as_string());
}

auto ends_with(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!v.is_string() || !operand.is_string()) return false;
  return v.as_string().ends_with(operand.as_string());
}

} // namespace verdict::operators
