#pragma once

/** \file operator_table.hpp
 *  \brief Registry mapping operator names ("$gte", "$regex", ...) to handlers.
 *
 * The table is built with every built-in operator, may be extended through
 * register_operator(), and is then frozen. A frozen table is read-only, so
 * concurrent lookups need no locking. The only mutable state reachable from a
 * frozen table is the compiled-pattern cache, which synchronizes itself.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/cache/pattern_cache.hpp"
#include "verdict/error.hpp"
#include "verdict/options.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Closed set of built-in operator kinds; registered extensions are `custom`. */
enum class operator_kind : std::uint8_t {
  eq, ne, gt, gte, lt, lte,
  in, nin, all, size,
  exists, type,
  regex,
  elem_match,
  and_, or_, not_,
  between,
  date_before, date_after,
  contains, starts_with, ends_with,
  custom
};

enum class operator_family : std::uint8_t {
  comparison, collection, existence, pattern, structural, logical, range, date, string, custom
};

class OperatorTable;

/** \brief What a handler may consult besides its value and operand. */
struct match_context {
  const OperatorTable& table;
};

/** \brief true/false for a determined clause; an error marks it undetermined. */
using operator_result = std::expected<bool, core::error>;

/** \brief Handler signature: (resolved value, operand, context) -> operator_result.
 *  Handlers must be pure and thread-safe.
 */
using operator_handler = std::function<operator_result(const value&, const value&, const match_context&)>;

struct operator_entry {
  std::string name;
  operator_kind kind{operator_kind::custom};
  operator_family family{operator_family::custom};
  operator_handler handler;
};

class OperatorTable {
public:
  /** \brief Table holding every built-in operator, not yet frozen. */
  explicit OperatorTable(const evaluator_options& options = {});

  OperatorTable(const OperatorTable&) = delete;
  OperatorTable& operator=(const OperatorTable&) = delete;

  /** \brief Add a custom operator before the table is frozen.
   *
   * \param name Operator name including the '$' prefix
   * \return invalid_argument for a malformed or already registered name,
   *         precondition_failed once the table is frozen
   */
  auto register_operator(std::string name, operator_handler handler) -> std::expected<void, core::error>;

  /** \brief Make the table read-only. Idempotent. */
  auto freeze() noexcept -> void { frozen_ = true; }
  [[nodiscard]] auto frozen() const noexcept -> bool { return frozen_; }

  /** \brief Handler entry for name, or nullptr when the operator is unknown. */
  [[nodiscard]] auto lookup(std::string_view name) const -> const operator_entry*;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
  [[nodiscard]] auto names() const -> std::vector<std::string>;

  /** \brief Shared compiled-pattern cache used by $regex. */
  [[nodiscard]] auto patterns() const noexcept -> cache::PatternCache& { return *patterns_; }
  [[nodiscard]] auto pattern_cache_stats() const -> cache::CacheStats { return patterns_->stats(); }

  /** \brief Longest string value $regex searches; longer values are invalid_operand. */
  [[nodiscard]] auto regex_subject_limit() const noexcept -> std::size_t { return regex_subject_limit_; }

private:
  std::map<std::string, operator_entry, std::less<>> entries_;
  std::unique_ptr<cache::PatternCache> patterns_;
  std::size_t regex_subject_limit_;
  bool frozen_{false};
};

/** \brief Name of a built-in kind, e.g. "$elemMatch"; "custom" for extensions. */
auto to_string(operator_kind kind) noexcept -> std::string_view;

} // namespace verdict
