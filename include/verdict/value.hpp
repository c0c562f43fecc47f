#pragma once

/** \file value.hpp
 *  \brief Document value tree consumed by the evaluator.
 *
 * A value is null, a boolean, a 64-bit integer, a double, a string, an array
 * or an object (string-keyed map). Documents, predicate queries and operands
 * all share this representation.
 * Ownership: value-semantic and self-contained, like filter_expr.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace verdict {

/** \brief Runtime type of a value, matching the $type vocabulary. */
enum class value_type { null, boolean, number, string, array, object };

struct value {
  using array = std::vector<value>;
  using object = std::map<std::string, value, std::less<>>;

  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, array, object> node{nullptr};

  value() = default;
  value(std::nullptr_t) {}
  value(bool b) : node(b) {}
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  value(T i) : node(static_cast<std::int64_t>(i)) {}
  value(double d) : node(d) {}
  value(const char* s) : node(std::string(s)) {}
  value(std::string s) : node(std::move(s)) {}
  value(std::string_view s) : node(std::string(s)) {}
  value(array a) : node(std::move(a)) {}
  value(object o) : node(std::move(o)) {}

  /** \brief Build an object from key/value pairs: value::make_object({{"age", 25}}). */
  static auto make_object(std::initializer_list<std::pair<const std::string, value>> fields) -> value {
    return value{object(fields)};
  }
  /** \brief Build an array: value::make_array({1, "two", 3.0}). */
  static auto make_array(std::initializer_list<value> items) -> value {
    return value{array(items)};
  }

  [[nodiscard]] auto is_null() const noexcept -> bool { return std::holds_alternative<std::nullptr_t>(node); }
  [[nodiscard]] auto is_bool() const noexcept -> bool { return std::holds_alternative<bool>(node); }
  [[nodiscard]] auto is_int() const noexcept -> bool { return std::holds_alternative<std::int64_t>(node); }
  [[nodiscard]] auto is_double() const noexcept -> bool { return std::holds_alternative<double>(node); }
  [[nodiscard]] auto is_number() const noexcept -> bool { return is_int() || is_double(); }
  [[nodiscard]] auto is_string() const noexcept -> bool { return std::holds_alternative<std::string>(node); }
  [[nodiscard]] auto is_array() const noexcept -> bool { return std::holds_alternative<array>(node); }
  [[nodiscard]] auto is_object() const noexcept -> bool { return std::holds_alternative<object>(node); }

  [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(node); }
  [[nodiscard]] auto as_int() const -> std::int64_t { return std::get<std::int64_t>(node); }
  [[nodiscard]] auto as_string() const -> const std::string& { return std::get<std::string>(node); }
  [[nodiscard]] auto as_array() const -> const array& { return std::get<array>(node); }
  [[nodiscard]] auto as_object() const -> const object& { return std::get<object>(node); }

  /** \brief Numeric view of an int or double; nullopt for any other type. */
  [[nodiscard]] auto as_number() const noexcept -> std::optional<double>;

  /** \brief Integral view: ints, and doubles with no fractional part. */
  [[nodiscard]] auto as_integer() const noexcept -> std::optional<std::int64_t>;

  [[nodiscard]] auto type() const noexcept -> value_type;
};

/** \brief Deep equality. Numbers compare by numeric value (1 == 1.0). */
auto operator==(const value& a, const value& b) -> bool;
inline auto operator!=(const value& a, const value& b) -> bool { return !(a == b); }

/** \brief Three-way ordering for comparable pairs.
 *
 * Numbers order numerically and strings lexicographically. Any other pairing
 * (number vs string, booleans, nulls, containers) is not orderable and
 * yields nullopt.
 */
auto compare(const value& a, const value& b) -> std::optional<int>;

/** \brief $type vocabulary name: "string", "number", "boolean", "array", "object", "null". */
auto type_name(value_type t) noexcept -> std::string_view;

/** \brief Parse a $type vocabulary name. */
auto parse_type_name(std::string_view name) noexcept -> std::optional<value_type>;

/** \brief Compact JSON-like rendering for diagnostics. */
auto to_string(const value& v) -> std::string;

} // namespace verdict
