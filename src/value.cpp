#include "verdict/value.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace verdict {

auto value::as_number() const noexcept -> std::optional<double> {
  if (const auto* i = std::get_if<std::int64_t>(&node)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&node)) return *d;
  return std::nullopt;
}

auto value::as_integer() const noexcept -> std::optional<std::int64_t> {
  if (const auto* i = std::get_if<std::int64_t>(&node)) return *i;
  if (const auto* d = std::get_if<double>(&node)) {
    if (!std::isfinite(*d) || std::trunc(*d) != *d) return std::nullopt;
    if (*d < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
        *d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(*d);
  }
  return std::nullopt;
}

auto value::type() const noexcept -> value_type {
  switch (node.index()) {
    case 0: return value_type::null;
    case 1: return value_type::boolean;
    case 2:
    case 3: return value_type::number;
    case 4: return value_type::string;
    case 5: return value_type::array;
    default: return value_type::object;
  }
}

namespace {

// Exact int64 vs double ordering; d must not be NaN.
auto compare_int_double(std::int64_t i, double d) -> int {
  constexpr double kTwo63 = 9223372036854775808.0;
  if (d >= kTwo63) return -1;
  if (d < -kTwo63) return 1;
  const double t = std::trunc(d);
  const auto ti = static_cast<std::int64_t>(t);
  if (i != ti) return i < ti ? -1 : 1;
  if (d > t) return -1;
  if (d < t) return 1;
  return 0;
}

// Pairs involving an int compare exactly so large int64 values do not
// collapse through double rounding.
auto compare_numbers(const value& a, const value& b) -> int {
  if (a.is_int() && b.is_int()) {
    const auto x = a.as_int();
    const auto y = b.as_int();
    return (x < y) ? -1 : (x > y ? 1 : 0);
  }
  if (a.is_int()) return compare_int_double(a.as_int(), std::get<double>(b.node));
  if (b.is_int()) return -compare_int_double(b.as_int(), std::get<double>(a.node));
  const double x = std::get<double>(a.node);
  const double y = std::get<double>(b.node);
  if (x < y) return -1;
  if (x > y) return 1;
  return 0;
}

auto escape(const std::string& s) -> std::string {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace

auto operator==(const value& a, const value& b) -> bool {
  if (a.is_number() && b.is_number()) {
    const auto x = a.as_number();
    const auto y = b.as_number();
    if (std::isnan(*x) || std::isnan(*y)) return false;
    return compare_numbers(a, b) == 0;
  }
  if (a.node.index() != b.node.index()) return false;
  return a.node == b.node;
}

auto compare(const value& a, const value& b) -> std::optional<int> {
  if (a.is_number() && b.is_number()) {
    if (std::isnan(*a.as_number()) || std::isnan(*b.as_number())) return std::nullopt;
    return compare_numbers(a, b);
  }
  if (a.is_string() && b.is_string()) {
    const int c = a.as_string().compare(b.as_string());
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

auto type_name(value_type t) noexcept -> std::string_view {
  switch (t) {
    case value_type::null: return "null";
    case value_type::boolean: return "boolean";
    case value_type::number: return "number";
    case value_type::string: return "string";
    case value_type::array: return "array";
    case value_type::object: return "object";
  }
  return "null";
}

auto parse_type_name(std::string_view name) noexcept -> std::optional<value_type> {
  if (name == "null") return value_type::null;
  if (name == "boolean") return value_type::boolean;
  if (name == "number") return value_type::number;
  if (name == "string") return value_type::string;
  if (name == "array") return value_type::array;
  if (name == "object") return value_type::object;
  return std::nullopt;
}

auto to_string(const value& v) -> std::string {
  switch (v.type()) {
    case value_type::null: return "null";
    case value_type::boolean: return v.as_bool() ? "true" : "false";
    case value_type::number: {
      if (v.is_int()) return std::to_string(v.as_int());
      std::ostringstream os;
      os << *v.as_number();
      return os.str();
    }
    case value_type::string: return escape(v.as_string());
    case value_type::array: {
      std::string out = "[";
      bool first = true;
      for (const auto& item : v.as_array()) {
        if (!first) out += ",";
        out += to_string(item);
        first = false;
      }
      return out + "]";
    }
    case value_type::object: {
      std::string out = "{";
      bool first = true;
      for (const auto& [k, item] : v.as_object()) {
        if (!first) out += ",";
        out += escape(k) + ":" + to_string(item);
        first = false;
      }
      return out + "}";
    }
  }
  return "null";
}

} // namespace verdict
