/**
 * Loan eligibility example using verdict
 *
 * This example demonstrates:
 * - Building predicates and AND/OR groups
 * - Evaluating one specification against documents with and without gaps
 * - Reading tri-state results and the run summary
 * - Registering a custom operator before first use
 */

#include <verdict/verdict.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace verdict;

namespace {

value op(const char* name, value operand) {
    return value::make_object({{name, std::move(operand)}});
}

specification make_loan_specification() {
    specification spec;
    spec.id = "loan-eligibility";
    spec.predicates = {
        predicate{"adult", {{"applicant.age", op("$gte", 18)}}},
        predicate{"resident", {{"applicant.country", op("$in", value::make_array({"NO", "SE", "DK"}))}}},
        predicate{"income", {{"finance.monthly_income", op("$between", value::make_array({3000, 250000}))}}},
        predicate{"clean_record", {{"finance.defaults", op("$size", 0)}}},
        predicate{"verified_email", {{"applicant.email", op("$regex", "^[^@\\s]+@[^@\\s]+\\.[a-z]+$")}}},
        predicate{"reference_code", {{"applicant.reference", op("$digits", 8)}}},
    };
    spec.groups = {
        predicate_group{"basic", junction::and_, {predicate{"adult", {}}, predicate{"resident", {}}}},
        predicate_group{"financial", junction::and_, {predicate{"income", {}}, predicate{"clean_record", {}}}},
        predicate_group{"contactable", junction::or_, {predicate{"verified_email", {}}, predicate{"phone", {}}}},
    };
    return spec;
}

void print_outcome(const std::string& label, const evaluation_outcome& outcome) {
    std::cout << "== " << label << " ==\n";
    for (const auto& r : outcome.predicate_results) {
        std::cout << "  " << r.predicate_id << ": " << to_string(r.state);
        if (auto why = r.reason()) {
            std::cout << " (" << *why << ")";
        }
        std::cout << "\n";
    }
    for (const auto& g : outcome.group_results) {
        std::cout << "  group " << g.group_id << " [" << to_string(g.join) << "]: "
                  << (g.matched ? "matched" : "not matched");
        if (!g.matched) {
            std::cout << " - " << g.reason();
        }
        std::cout << "\n";
    }
    const auto& s = outcome.summary;
    std::cout << "  total=" << s.total << " matched=" << s.matched << " not_matched=" << s.not_matched
              << " undetermined=" << s.undetermined
              << " fully_determined=" << (s.fully_determined ? "yes" : "no") << "\n\n";
}

} // namespace

int main() {
    std::cout << "=== verdict eligibility example ===\n\n";

    auto options = evaluator_options::from_env();

    // Custom operator: the value is a string of exactly N decimal digits.
    auto table = std::make_shared<OperatorTable>(options);
    auto registered = table->register_operator(
        "$digits", [](const value& v, const value& operand, const match_context&) -> operator_result {
            auto n = operand.as_integer();
            if (!n || *n < 0) {
                return std::unexpected(core::error{
                    core::error_code::invalid_operand, "$digits expects a non-negative integer", "example"});
            }
            if (!v.is_string()) return false;
            const auto& s = v.as_string();
            if (static_cast<std::int64_t>(s.size()) != *n) return false;
            for (char c : s) {
                if (c < '0' || c > '9') return false;
            }
            return true;
        });
    if (!registered) {
        std::cerr << "Failed to register $digits: " << registered.error().message << "\n";
        return 1;
    }

    SpecificationEvaluator evaluator(std::make_shared<const PredicateEvaluator>(table, options), options);
    const auto spec = make_loan_specification();

    const auto complete = value::make_object({
        {"applicant", value::make_object({
                          {"age", 41},
                          {"country", "NO"},
                          {"email", "kari@example.no"},
                          {"reference", "20240117"},
                      })},
        {"finance", value::make_object({
                        {"monthly_income", 52000},
                        {"defaults", value::make_array({})},
                    })},
    });

    const auto partial = value::make_object({
        {"applicant", value::make_object({
                          {"age", 17},
                          {"country", "US"},
                      })},
        {"finance", value::make_object({
                        {"defaults", value::make_array({"2019-03"})},
                    })},
    });

    print_outcome("complete application", evaluator.evaluate(complete, spec));
    print_outcome("partial application", evaluator.evaluate(partial, spec));

    const auto stats = evaluator.predicate_evaluator().table().pattern_cache_stats();
    std::cout << "pattern cache: hits=" << stats.hits << " misses=" << stats.misses << "\n";
    return 0;
}
