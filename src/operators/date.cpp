#include "handlers.hpp"

#include <chrono>

#include "verdict/instant.hpp"

namespace verdict::operators {

namespace {

// Unparseable values or operands are non-matches, not errors.
template <typename Cmp>
auto compare_instants(const value& v, const value& operand, Cmp cmp) -> operator_result {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  auto lhs = to_instant(v, now);
  auto rhs = to_instant(operand, now);
  if (!lhs || !rhs) return false;
  return cmp(*lhs, *rhs);
}

} // namespace

auto date_before(const value& v, const value& operand, const match_context&) -> operator_result {
  return compare_instants(v, operand, [](instant a, instant b) { return a < b; });
}

auto date_after(const value& v, const value& operand, const match_context&) -> operator_result {
  return compare_instants(v, operand, [](instant a, instant b) { return a > b; });
}

} // namespace verdict::operators
