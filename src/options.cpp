#include "verdict/options.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <utility>

#include "verdict/core/log.hpp"
#include "verdict/core/platform_utils.hpp"

namespace verdict {

namespace {

auto invalid(std::string message) -> core::error {
  return core::error{core::error_code::config_invalid, std::move(message), "options"};
}

auto report(const core::error& err) -> void {
  core::log_warning(err.component, std::string(core::to_string(err.code)) + ": " + err.message);
}

// nullopt when unset or empty.
auto parse_count(const char* name) -> std::expected<std::optional<std::size_t>, core::error> {
  auto v = core::safe_getenv(name);
  if (!v || v->empty()) return std::optional<std::size_t>{};
  std::size_t out{};
  const auto* first = v->data();
  const auto* last = v->data() + v->size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return std::unexpected(invalid(std::string("ignoring ") + name + "=" + *v + ": not a count"));
  }
  return std::optional<std::size_t>{out};
}

} // namespace

auto evaluator_options::validate() const -> std::expected<void, core::error> {
  if (pattern_cache_capacity == 0) return std::unexpected(invalid("pattern_cache_capacity must be positive"));
  if (pattern_cache_shards == 0) return std::unexpected(invalid("pattern_cache_shards must be positive"));
  if (regex_max_subject_length == 0) return std::unexpected(invalid("regex_max_subject_length must be positive"));
  return {};
}

auto evaluator_options::from_env() -> evaluator_options {
  evaluator_options opts;

  if (auto n = parse_count("VERDICT_THREADS"); !n) {
    report(n.error());
  } else if (*n) {
    opts.num_threads = **n;
  }

  if (auto n = parse_count("VERDICT_PATTERN_CACHE_CAPACITY"); !n) {
    report(n.error());
  } else if (*n) {
    evaluator_options candidate = opts;
    candidate.pattern_cache_capacity = **n;
    if (auto ok = candidate.validate(); ok) {
      opts = candidate;
    } else {
      report(ok.error());
    }
  }

  opts.verbose = core::env_flag("VERDICT_DEBUG");
  return opts;
}

} // namespace verdict
