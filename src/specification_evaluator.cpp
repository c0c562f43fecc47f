#include "verdict/specification_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "verdict/core/log.hpp"

namespace verdict {

namespace {

// Runs work on the pool, or inline when the pool refuses new tasks.
template <typename Result, typename Func>
auto run_async(core::ThreadPool& pool, Func work) -> std::future<Result> {
  try {
    return pool.submit(work);
  } catch (const std::runtime_error& e) {
    core::log_warning("specification", std::string("pool rejected task, running inline: ") + e.what());
  }
  std::promise<Result> ready;
  ready.set_value(work());
  return ready.get_future();
}

auto internal_failure(std::string id) -> predicate_result {
  predicate_result r;
  r.predicate_id = std::move(id);
  r.state = evaluation_state::undetermined;
  r.failure_reason = "Internal error during evaluation";
  return r;
}

} // namespace

SpecificationEvaluator::SpecificationEvaluator(const evaluator_options& options)
    : SpecificationEvaluator(std::make_shared<const PredicateEvaluator>(options), options) {}

SpecificationEvaluator::SpecificationEvaluator(std::shared_ptr<const PredicateEvaluator> evaluator,
                                               const evaluator_options& options)
    : evaluator_(std::move(evaluator)),
      pool_(std::make_unique<core::ThreadPool>(options.num_threads)),
      options_(options) {
  if (!evaluator_) {
    throw std::invalid_argument("SpecificationEvaluator requires a predicate evaluator");
  }
}

SpecificationEvaluator::~SpecificationEvaluator() = default;

auto SpecificationEvaluator::evaluate(const value& document, const specification& spec) const -> evaluation_outcome {
  core::log_debug("specification", "Starting evaluation of specification '" + spec.id + "'", options_.verbose);

  // Phase 1: every top-level predicate, independently.
  core::TaskGroup<predicate_result> pending;
  pending.reserve(spec.predicates.size());
  for (const auto& p : spec.predicates) {
    pending.add(run_async<predicate_result>(*pool_, [this, &document, &p] {
      return evaluator_->evaluate(document, p);
    }));
  }

  std::unordered_map<std::string, predicate_result> results;
  std::vector<std::string> order;
  results.reserve(spec.predicates.size());
  order.reserve(spec.predicates.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    const auto& id = spec.predicates[i].id;
    predicate_result r;
    try {
      r = pending[i].get();
    } catch (const std::exception& e) {
      core::log_warning("specification", "predicate '" + id + "' task failed: " + e.what());
      r = internal_failure(id);
    }
    // Duplicate ids: the first declaration wins.
    if (results.emplace(id, std::move(r)).second) order.push_back(id);
  }

  core::log_debug("specification",
                  "Evaluated " + std::to_string(results.size()) + " predicates for specification '" + spec.id + "'",
                  options_.verbose);

  // Phase 2: groups read the frozen map only.
  // Declared after results so unwinding waits for group tasks before the map goes.
  core::TaskGroup<group_result> group_pending;
  group_pending.reserve(spec.groups.size());
  for (const auto& g : spec.groups) {
    group_pending.add(run_async<group_result>(*pool_, [this, &document, &g, &results] {
      return evaluate_group(document, g, results);
    }));
  }

  evaluation_outcome outcome;
  outcome.specification_id = spec.id;
  outcome.group_results.reserve(spec.groups.size());
  for (std::size_t i = 0; i < group_pending.size(); ++i) {
    try {
      outcome.group_results.push_back(group_pending[i].get());
    } catch (const std::exception& e) {
      const auto& g = spec.groups[i];
      core::log_warning("specification", "group '" + g.id + "' task failed: " + e.what());
      group_result failed;
      failed.group_id = g.id;
      failed.join = g.join;
      for (const auto& m : g.members) failed.member_results.push_back(internal_failure(m.id));
      outcome.group_results.push_back(std::move(failed));
    }
  }

  outcome.predicate_results.reserve(order.size());
  for (const auto& id : order) {
    outcome.predicate_results.push_back(std::move(results.at(id)));
  }
  outcome.summary = evaluation_summary::from(outcome.predicate_results);

  const auto& s = outcome.summary;
  core::log_debug("specification",
                  "Completed evaluation of specification '" + spec.id + "' - Total: " + std::to_string(s.total) +
                      ", Matched: " + std::to_string(s.matched) + ", Not Matched: " + std::to_string(s.not_matched) +
                      ", Undetermined: " + std::to_string(s.undetermined) +
                      ", Fully Determined: " + (s.fully_determined ? "true" : "false"),
                  options_.verbose);
  return outcome;
}

auto SpecificationEvaluator::evaluate_group(const value& document, const predicate_group& group,
                                            const std::unordered_map<std::string, predicate_result>& results) const
    -> group_result {
  group_result out;
  out.group_id = group.id;
  out.join = group.join;
  out.member_results.reserve(group.members.size());

  for (const auto& member : group.members) {
    auto it = results.find(member.id);
    if (it != results.end()) {
      out.member_results.push_back(it->second);
    } else {
      // Not declared at specification scope: evaluate by id alone.
      out.member_results.push_back(evaluator_->evaluate(document, predicate{member.id, {}}));
    }
  }

  const auto& members = out.member_results;
  if (group.join == junction::and_) {
    out.matched = std::all_of(members.begin(), members.end(), [](const predicate_result& r) { return r.matched(); });
  } else {
    out.matched = std::any_of(members.begin(), members.end(), [](const predicate_result& r) { return r.matched(); });
  }
  return out;
}

} // namespace verdict
