#include "verdict/result.hpp"

#include <algorithm>
#include <utility>

namespace verdict {

auto to_string(junction j) noexcept -> std::string_view {
  return j == junction::and_ ? "AND" : "OR";
}

auto to_string(evaluation_state s) noexcept -> std::string_view {
  switch (s) {
    case evaluation_state::matched: return "MATCHED";
    case evaluation_state::not_matched: return "NOT_MATCHED";
    case evaluation_state::undetermined: return "UNDETERMINED";
  }
  return "UNDETERMINED";
}

auto predicate_result::reason() const -> std::optional<std::string> {
  if (state == evaluation_state::matched) return std::nullopt;
  if (failure_reason) return *failure_reason;
  if (!missing_paths.empty()) {
    std::string out = "Missing data at: ";
    bool first = true;
    for (const auto& p : missing_paths) {
      if (!first) out += ", ";
      out += p;
      first = false;
    }
    return out;
  }
  return state == evaluation_state::undetermined ? std::string("Evaluation failed")
                                                 : std::string("Non-matching values");
}

auto predicate_result::missing_definition(std::string id) -> predicate_result {
  predicate_result r;
  r.predicate_id = std::move(id);
  r.state = evaluation_state::undetermined;
  r.missing_paths.insert("predicate definition");
  r.failure_reason = "Predicate definition not found";
  return r;
}

auto group_result::reason() const -> std::string {
  std::string out;
  for (const auto& r : member_results) {
    auto why = r.reason();
    if (!why) continue;
    if (!out.empty()) out += ", ";
    out += *why;
  }
  return out;
}

auto evaluation_summary::from(const std::vector<predicate_result>& results) -> evaluation_summary {
  evaluation_summary s;
  s.total = results.size();
  for (const auto& r : results) {
    switch (r.state) {
      case evaluation_state::matched: ++s.matched; break;
      case evaluation_state::not_matched: ++s.not_matched; break;
      case evaluation_state::undetermined: ++s.undetermined; break;
    }
  }
  s.fully_determined = (s.undetermined == 0);
  return s;
}

auto evaluation_outcome::find_predicate(std::string_view id) const noexcept -> const predicate_result* {
  auto it = std::find_if(predicate_results.begin(), predicate_results.end(),
                         [&](const predicate_result& r) { return r.predicate_id == id; });
  return it == predicate_results.end() ? nullptr : &*it;
}

auto evaluation_outcome::find_group(std::string_view id) const noexcept -> const group_result* {
  auto it = std::find_if(group_results.begin(), group_results.end(),
                         [&](const group_result& r) { return r.group_id == id; });
  return it == group_results.end() ? nullptr : &*it;
}

} // namespace verdict
