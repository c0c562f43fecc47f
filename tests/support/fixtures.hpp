#pragma once

// Shorthand for building documents and queries in tests.

#include <initializer_list>
#include <string>
#include <utility>

#include "verdict/predicate_evaluator.hpp"
#include "verdict/specification.hpp"
#include "verdict/value.hpp"

namespace verdict::test {

using field = std::pair<const std::string, value>;

inline auto obj(std::initializer_list<field> fields) -> value { return value::make_object(fields); }
inline auto arr(std::initializer_list<value> items) -> value { return value::make_array(items); }

inline auto pred(std::string id, std::initializer_list<field> query) -> predicate {
  return predicate{std::move(id), value::object(query)};
}

/** Reference to a predicate declared at specification scope. */
inline auto ref(std::string id) -> predicate { return predicate{std::move(id), {}}; }

/** Evaluates {path: condition} against doc and returns the state. */
inline auto state_of(const PredicateEvaluator& ev, const value& doc, const std::string& path, value condition)
    -> evaluation_state {
  return ev.evaluate(doc, predicate{"test", value::object{{path, std::move(condition)}}}).state;
}

} // namespace verdict::test
