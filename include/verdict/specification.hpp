#pragma once

/** \file specification.hpp
 *  \brief Predicates, predicate groups and specifications.
 *
 * Ownership: a specification is immutable once built and owned by the caller.
 * Evaluators only read it, so one specification may be evaluated against many
 * documents, from many threads.
 */

#include <string>
#include <string_view>
#include <vector>

#include "verdict/value.hpp"

namespace verdict {

/** \brief A named condition: field path -> operator map.
 *
 * Example query: {"age": {"$gte": 18}, "address.city": {"$in": ["Oslo", "Bergen"]}}.
 * A field whose entry is not an operator map is compared with implicit $eq.
 */
struct predicate {
  std::string id;        /**< expected unique within a specification */
  value::object query;   /**< field path -> operator map (may be empty for references) */
};

/** \brief Boolean junction joining the members of a predicate group. */
enum class junction { and_, or_ };

/** \brief A named AND/OR composition of predicates by reference. */
struct predicate_group {
  std::string id;
  junction join{junction::and_};
  std::vector<predicate> members;   /**< resolved by id; member queries are usually empty */
};

struct specification {
  std::string id;
  std::vector<predicate> predicates;
  std::vector<predicate_group> groups;
};

/** \brief "AND" or "OR". */
auto to_string(junction j) noexcept -> std::string_view;

} // namespace verdict
