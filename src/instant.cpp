#include "verdict/instant.hpp"

#include <charconv>

namespace verdict {

namespace {

using namespace std::chrono;

// Reads exactly n digits at text[pos].
auto digits(std::string_view text, std::size_t pos, std::size_t n) -> std::optional<int> {
  if (pos + n > text.size()) return std::nullopt;
  int out = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') return std::nullopt;
    out = out * 10 + (c - '0');
  }
  return out;
}

} // namespace

auto parse_iso_instant(std::string_view text) -> std::optional<instant> {
  // Date part: YYYY-MM-DD
  auto y = digits(text, 0, 4);
  auto mo = digits(text, 5, 2);
  auto d = digits(text, 8, 2);
  if (!y || !mo || !d || text[4] != '-' || text[7] != '-') return std::nullopt;
  const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) return std::nullopt;
  instant t = time_point_cast<milliseconds>(sys_days{ymd});
  if (text.size() == 10) return t;

  // Time part: THH:MM[:SS[.fff]]
  if (text[10] != 'T' && text[10] != 't') return std::nullopt;
  auto hh = digits(text, 11, 2);
  auto mm = digits(text, 14, 2);
  if (!hh || !mm || text.size() < 16 || text[13] != ':' || *hh > 23 || *mm > 59) return std::nullopt;
  t += hours{*hh} + minutes{*mm};
  std::size_t pos = 16;
  if (pos < text.size() && text[pos] == ':') {
    auto ss = digits(text, pos + 1, 2);
    if (!ss || *ss > 59) return std::nullopt;
    t += seconds{*ss};
    pos += 3;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      const std::size_t start = pos;
      int millis = 0;
      int scale = 100;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        millis += (text[pos] - '0') * scale;
        scale /= 10;
        ++pos;
      }
      if (pos == start) return std::nullopt;
      t += milliseconds{millis};
    }
  }

  // Zone: Z, +hh:mm or -hh:mm
  if (pos == text.size()) return t;
  const char z = text[pos];
  if ((z == 'Z' || z == 'z') && pos + 1 == text.size()) return t;
  if ((z == '+' || z == '-') && pos + 6 == text.size() && text[pos + 3] == ':') {
    auto oh = digits(text, pos + 1, 2);
    auto om = digits(text, pos + 4, 2);
    if (!oh || !om || *oh > 23 || *om > 59) return std::nullopt;
    const minutes offset = hours{*oh} + minutes{*om};
    return z == '+' ? t - offset : t + offset;
  }
  return std::nullopt;
}

auto to_instant(const value& v, instant now) -> std::optional<instant> {
  if (v.is_string()) {
    if (v.as_string() == "now") return now;
    return parse_iso_instant(v.as_string());
  }
  if (v.is_number()) {
    auto ms = v.as_integer();
    if (!ms) return std::nullopt;
    return instant{milliseconds{*ms}};
  }
  return std::nullopt;
}

} // namespace verdict
