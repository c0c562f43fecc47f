#include "handlers.hpp"

#include <string>

namespace verdict::operators {

namespace {

auto ordered(const value& v, const value& operand, const char* op, bool (*accept)(int)) -> operator_result {
  auto c = compare(v, operand);
  if (!c) {
    return std::unexpected(core::error{
        core::error_code::type_mismatch,
        std::string("Type mismatch: ") + op + " cannot compare " +
            std::string(type_name(v.type())) + " with " + std::string(type_name(operand.type())),
        "operators.comparison"});
  }
  return accept(*c);
}

} // namespace

auto eq(const value& v, const value& operand, const match_context&) -> operator_result {
  return v == operand;
}

// Values of different types are a mismatch, so $ne does not match them either.
auto ne(const value& v, const value& operand, const match_context&) -> operator_result {
  if (v.type() != operand.type()) return false;
  return v != operand;
}

auto gt(const value& v, const value& operand, const match_context&) -> operator_result {
  return ordered(v, operand, "$gt", [](int c) { return c > 0; });
}

auto gte(const value& v, const value& operand, const match_context&) -> operator_result {
  return ordered(v, operand, "$gte", [](int c) { return c >= 0; });
}

auto lt(const value& v, const value& operand, const match_context&) -> operator_result {
  return ordered(v, operand, "$lt", [](int c) { return c < 0; });
}

auto lte(const value& v, const value& operand, const match_context&) -> operator_result {
  return ordered(v, operand, "$lte", [](int c) { return c <= 0; });
}

} // namespace verdict::operators
