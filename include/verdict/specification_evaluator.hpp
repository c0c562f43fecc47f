#pragma once

/** \file specification_evaluator.hpp
 *  \brief Evaluate a whole specification (predicates and groups) against a document.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

#include "verdict/core/thread_pool.hpp"
#include "verdict/options.hpp"
#include "verdict/predicate_evaluator.hpp"
#include "verdict/result.hpp"
#include "verdict/specification.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Specification orchestrator.
 *
 * Phase 1 evaluates every top-level predicate on the worker pool and freezes
 * the results into an id -> result map once all of them finished. Phase 2
 * evaluates groups (also on the pool) reading only that map; a member id the
 * specification does not define is evaluated on demand and comes back
 * UNDETERMINED "Predicate definition not found". Each predicate is evaluated
 * at most once per run however many groups reference it.
 *
 * Example usage:
 * ```cpp
 * SpecificationEvaluator evaluator;
 * auto doc = value::make_object({{"age", 25}});
 * specification spec{"adult-check",
 *                    {predicate{"adult", {{"age", value::make_object({{"$gte", 18}})}}}},
 *                    {}};
 * auto outcome = evaluator.evaluate(doc, spec);
 * // outcome.summary.matched == 1
 * ```
 *
 * Thread-safety: evaluate() is const and may be called concurrently.
 */
class SpecificationEvaluator {
public:
    explicit SpecificationEvaluator(const evaluator_options& options = {});
    explicit SpecificationEvaluator(std::shared_ptr<const PredicateEvaluator> evaluator,
                                    const evaluator_options& options = {});
    ~SpecificationEvaluator();

    SpecificationEvaluator(const SpecificationEvaluator&) = delete;
    SpecificationEvaluator& operator=(const SpecificationEvaluator&) = delete;

    /** \brief Evaluate spec against document. Never throws for data or query problems. */
    [[nodiscard]] auto evaluate(const value& document, const specification& spec) const -> evaluation_outcome;

    [[nodiscard]] auto predicate_evaluator() const noexcept -> const PredicateEvaluator& { return *evaluator_; }
    [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return pool_->num_threads(); }

private:
    auto evaluate_group(const value& document, const predicate_group& group,
                        const std::unordered_map<std::string, predicate_result>& results) const -> group_result;

    std::shared_ptr<const PredicateEvaluator> evaluator_;
    std::unique_ptr<core::ThreadPool> pool_;
    evaluator_options options_;
};

} // namespace verdict
