#include "verdict/matcher.hpp"

#include "verdict/path_resolver.hpp"

namespace verdict {

namespace {

auto has_operator_key(const value::object& o) noexcept -> bool {
  for (const auto& [k, v] : o) {
    if (!k.empty() && k.front() == '$') return true;
  }
  return false;
}

// The objects match_value dispatches through the table rather than comparing.
auto is_operator_condition(const value& condition) noexcept -> bool {
  return condition.is_object() && (condition.as_object().empty() || has_operator_key(condition.as_object()));
}

auto unknown_operator(const std::string& name) -> core::error {
  return core::error{core::error_code::unknown_operator, "Unknown operator: " + name, "matcher"};
}

auto validate_query(const value::object& query, const OperatorTable& table) -> std::expected<void, core::error> {
  for (const auto& [path, condition] : query) {
    if (auto ok = validate_condition(condition, table); !ok) return ok;
  }
  return {};
}

} // namespace

auto is_operator_map(const value& v) noexcept -> bool {
  if (!v.is_object()) return false;
  const auto& o = v.as_object();
  if (o.empty()) return false;
  for (const auto& [k, item] : o) {
    if (k.empty() || k.front() != '$') return false;
  }
  return true;
}

auto validate_condition(const value& condition, const OperatorTable& table) -> std::expected<void, core::error> {
  if (!is_operator_condition(condition)) return {};

  for (const auto& [name, operand] : condition.as_object()) {
    const auto* entry = table.lookup(name);
    if (entry == nullptr) return std::unexpected(unknown_operator(name));

    std::expected<void, core::error> nested;
    switch (entry->kind) {
      case operator_kind::elem_match:
        if (operand.is_object()) {
          nested = is_operator_map(operand) ? validate_condition(operand, table)
                                            : validate_query(operand.as_object(), table);
        }
        break;
      case operator_kind::and_:
      case operator_kind::or_:
        if (operand.is_array()) {
          for (const auto& clause : operand.as_array()) {
            nested = validate_condition(clause, table);
            if (!nested) break;
          }
        }
        break;
      case operator_kind::not_:
        nested = validate_condition(operand, table);
        break;
      default:
        break;
    }
    if (!nested) return nested;
  }
  return {};
}

auto match_value(const value& current, const value& condition, const match_context& ctx) -> operator_result {
  if (!is_operator_condition(condition)) {
    return current == condition;
  }

  bool all = true;
  for (const auto& [name, operand] : condition.as_object()) {
    const auto* entry = ctx.table.lookup(name);
    if (entry == nullptr) {
      return std::unexpected(unknown_operator(name));
    }
    auto r = entry->handler(current, operand, ctx);
    if (!r) return r;
    all = all && *r;
  }
  return all;
}

auto match_document(const value& document, const value::object& query, const match_context& ctx) -> operator_result {
  bool all = true;
  for (const auto& [path, condition] : query) {
    auto resolved = resolve(document, path);
    if (!resolved) {
      all = false;
      continue;
    }
    auto r = match_value(**resolved, condition, ctx);
    if (!r) return r;
    all = all && *r;
  }
  return all;
}

} // namespace verdict
