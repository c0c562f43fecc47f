#pragma once

/** \file result.hpp
 *  \brief Tri-state evaluation results and the per-run outcome.
 *
 * All result types are immutable values produced once per evaluation run.
 * An evaluation_outcome is safe to share across threads after construction.
 */

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/specification.hpp"

namespace verdict {

/** \brief Outcome of one predicate. */
enum class evaluation_state {
  matched,       /**< all data present and every clause true */
  not_matched,   /**< all data present and at least one clause false */
  undetermined   /**< missing data, unknown operator, invalid operand or internal failure */
};

/** \brief "MATCHED", "NOT_MATCHED" or "UNDETERMINED". */
auto to_string(evaluation_state s) noexcept -> std::string_view;

/** \brief Result of evaluating one predicate against one document.
 *
 * Invariant: state == matched implies missing_paths and failure_reason are empty.
 */
struct predicate_result {
  std::string predicate_id;
  evaluation_state state{evaluation_state::undetermined};
  std::set<std::string> missing_paths;
  std::optional<std::string> failure_reason;

  [[nodiscard]] auto matched() const noexcept -> bool { return state == evaluation_state::matched; }
  [[nodiscard]] auto is_determined() const noexcept -> bool { return state != evaluation_state::undetermined; }

  /** \brief Why the predicate did not match; nullopt when it matched.
   *
   * Yields the failure reason when one is set, "Missing data at: a, b" when
   * paths were missing, and "Non-matching values" for a determined non-match.
   */
  [[nodiscard]] auto reason() const -> std::optional<std::string>;

  /** \brief UNDETERMINED result for a group member with no definition in the specification. */
  static auto missing_definition(std::string id) -> predicate_result;
};

struct group_result {
  std::string group_id;
  junction join{junction::and_};
  std::vector<predicate_result> member_results;   /**< same order as the group's members */
  bool matched{false};

  /** \brief Comma-joined reasons of the members that did not match. */
  [[nodiscard]] auto reason() const -> std::string;
};

/** \brief Counts over individual predicate results (groups excluded). */
struct evaluation_summary {
  std::size_t total{0};
  std::size_t matched{0};
  std::size_t not_matched{0};
  std::size_t undetermined{0};
  bool fully_determined{true};

  static auto from(const std::vector<predicate_result>& results) -> evaluation_summary;
};

struct evaluation_outcome {
  std::string specification_id;
  std::vector<predicate_result> predicate_results;
  std::vector<group_result> group_results;
  evaluation_summary summary;

  /** \brief Result for a predicate id, or nullptr if it was not evaluated in this run. */
  [[nodiscard]] auto find_predicate(std::string_view id) const noexcept -> const predicate_result*;
  [[nodiscard]] auto find_group(std::string_view id) const noexcept -> const group_result*;
};

} // namespace verdict
