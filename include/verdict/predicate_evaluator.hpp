#pragma once

/** \file predicate_evaluator.hpp
 *  \brief Evaluate one predicate against one document into a tri-state result.
 */

#include <memory>

#include "verdict/operator_table.hpp"
#include "verdict/options.hpp"
#include "verdict/result.hpp"
#include "verdict/specification.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Predicate-level evaluator.
 *
 * Every field path of the query is resolved; missing paths are collected and
 * make the result UNDETERMINED. Clauses of resolved fields are AND-ed. The
 * first clause that signals an error (unknown operator, type mismatch on an
 * ordering comparison, invalid operand, invalid pattern) stops clause
 * evaluation and makes the result UNDETERMINED with that error's message.
 *
 * evaluate() never throws: any exception raised while matching is logged and
 * reported as UNDETERMINED "Internal error during evaluation".
 *
 * Thread-safety: evaluate() is const and may run concurrently.
 */
class PredicateEvaluator {
public:
    /** \brief Evaluator over a fresh table of built-in operators. */
    explicit PredicateEvaluator(const evaluator_options& options = {});

    /** \brief Evaluator over a caller-built table (e.g. with custom operators).
     *  The table is frozen here.
     */
    explicit PredicateEvaluator(std::shared_ptr<OperatorTable> table, const evaluator_options& options = {});

    [[nodiscard]] auto evaluate(const value& document, const predicate& p) const noexcept -> predicate_result;

    [[nodiscard]] auto table() const noexcept -> const OperatorTable& { return *table_; }

private:
    auto evaluate_clauses(const value& document, const predicate& p) const -> predicate_result;

    std::shared_ptr<OperatorTable> table_;
    evaluator_options options_;
};

} // namespace verdict
