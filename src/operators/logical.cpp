#include "handlers.hpp"

#include "verdict/matcher.hpp"

namespace verdict::operators {

namespace {

// Evaluates every operator map in operand against v; errors win over results.
// A non-array operand or a non-object element makes the whole clause false.
template <bool Any>
auto combine(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  if (!operand.is_array()) return false;
  bool any = false;
  bool all = true;
  for (const auto& clause : operand.as_array()) {
    if (!clause.is_object()) return false;
    auto r = match_value(v, clause, ctx);
    if (!r) return r;
    any = any || *r;
    all = all && *r;
  }
  if constexpr (Any) {
    return any;   // or([]) == false
  } else {
    return all;   // and([]) == true
  }
}

} // namespace

auto and_(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  return combine<false>(v, operand, ctx);
}

auto or_(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  return combine<true>(v, operand, ctx);
}

// An undetermined inner clause stays undetermined; it is never inverted.
auto not_(const value& v, const value& operand, const match_context& ctx) -> operator_result {
  if (!operand.is_object()) return false;
  auto r = match_value(v, operand, ctx);
  if (!r) return r;
  return !*r;
}

auto between(const value& v, const value& operand, const match_context&) -> operator_result {
  if (!operand.is_array() || operand.as_array().size() != 2) return false;
  const auto& bounds = operand.as_array();
  auto lo = compare(v, bounds[0]);
  auto hi = compare(v, bounds[1]);
  if (!lo || !hi) return false;
  return *lo >= 0 && *hi <= 0;
}

} // namespace verdict::operators
