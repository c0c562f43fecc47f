#include "verdict/predicate_evaluator.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "verdict/core/log.hpp"
#include "verdict/matcher.hpp"
#include "verdict/path_resolver.hpp"

namespace verdict {

namespace {

constexpr const char* kInternalReason = "Internal error during evaluation";

auto undetermined_internal(const predicate& p) noexcept -> predicate_result {
  predicate_result r;
  try {
    r.predicate_id = p.id;
    r.failure_reason = kInternalReason;
  } catch (const std::exception&) {
    // out of memory: an anonymous undetermined result is still a valid result
  }
  r.state = evaluation_state::undetermined;
  return r;
}

auto report_exception(const predicate& p, const char* what) noexcept -> void {
  try {
    const core::error err{core::error_code::internal, "predicate '" + p.id + "' raised: " + what, "predicate"};
    core::log_warning(err.component, std::string(core::to_string(err.code)) + ": " + err.message);
  } catch (const std::exception&) {
    core::log_warning("predicate", "internal: predicate evaluation raised an exception");
  }
}

} // namespace

PredicateEvaluator::PredicateEvaluator(const evaluator_options& options)
    : PredicateEvaluator(std::make_shared<OperatorTable>(options), options) {}

PredicateEvaluator::PredicateEvaluator(std::shared_ptr<OperatorTable> table, const evaluator_options& options)
    : table_(std::move(table)), options_(options) {
  if (!table_) {
    throw std::invalid_argument("PredicateEvaluator requires an operator table");
  }
  table_->freeze();
}

auto PredicateEvaluator::evaluate(const value& document, const predicate& p) const noexcept -> predicate_result {
  try {
    return evaluate_clauses(document, p);
  } catch (const std::exception& e) {
    report_exception(p, e.what());
  } catch (...) {
    report_exception(p, "non-standard exception");
  }
  return undetermined_internal(p);
}

auto PredicateEvaluator::evaluate_clauses(const value& document, const predicate& p) const -> predicate_result {
  if (p.query.empty()) {
    return predicate_result::missing_definition(p.id);
  }

  predicate_result result;
  result.predicate_id = p.id;

  const match_context ctx{*table_};
  std::optional<core::error> failure;
  bool all_matched = true;

  for (const auto& [path, condition] : p.query) {
    auto resolved = resolve(document, path);
    if (!resolved) {
      result.missing_paths.insert(path);
      continue;
    }
    if (failure) continue;   // keep collecting missing paths only

    // Operator names are checked before any data-dependent short-circuit.
    auto checked = validate_condition(condition, *table_);
    auto r = checked ? match_value(**resolved, condition, ctx) : operator_result(std::unexpected(checked.error()));
    if (!r) {
      failure = std::move(r.error());
      core::log_warning("predicate", "predicate '" + p.id + "' field '" + path + "': " +
                                         std::string(core::to_string(failure->code)) + ": " + failure->message);
      continue;
    }
    all_matched = all_matched && *r;
  }

  if (!result.missing_paths.empty()) {
    result.state = evaluation_state::undetermined;
  } else if (failure) {
    result.state = evaluation_state::undetermined;
    result.failure_reason = std::move(failure->message);
  } else {
    result.state = all_matched ? evaluation_state::matched : evaluation_state::not_matched;
  }

  core::log_debug("predicate", "'" + p.id + "' -> " + std::string(to_string(result.state)), options_.verbose);
  return result;
}

} // namespace verdict
