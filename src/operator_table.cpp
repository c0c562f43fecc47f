#include "verdict/operator_table.hpp"

#include <array>
#include <utility>

#include "operators/handlers.hpp"

namespace verdict {

namespace {

using handler_fn = operator_result (*)(const value&, const value&, const match_context&);

struct builtin {
  std::string_view name;
  operator_kind kind;
  operator_family family;
  handler_fn fn;
};

constexpr std::array<builtin, 23> kBuiltins{{
    {"$eq", operator_kind::eq, operator_family::comparison, &operators::eq},
    {"$ne", operator_kind::ne, operator_family::comparison, &operators::ne},
    {"$gt", operator_kind::gt, operator_family::comparison, &operators::gt},
    {"$gte", operator_kind::gte, operator_family::comparison, &operators::gte},
    {"$lt", operator_kind::lt, operator_family::comparison, &operators::lt},
    {"$lte", operator_kind::lte, operator_family::comparison, &operators::lte},
    {"$in", operator_kind::in, operator_family::collection, &operators::in},
    {"$nin", operator_kind::nin, operator_family::collection, &operators::nin},
    {"$all", operator_kind::all, operator_family::collection, &operators::all},
    {"$size", operator_kind::size, operator_family::collection, &operators::size},
    {"$exists", operator_kind::exists, operator_family::existence, &operators::exists},
    {"$type", operator_kind::type, operator_family::existence, &operators::type},
    {"$regex", operator_kind::regex, operator_family::pattern, &operators::regex},
    {"$elemMatch", operator_kind::elem_match, operator_family::structural, &operators::elem_match},
    {"$and", operator_kind::and_, operator_family::logical, &operators::and_},
    {"$or", operator_kind::or_, operator_family::logical, &operators::or_},
    {"$not", operator_kind::not_, operator_family::logical, &operators::not_},
    {"$between", operator_kind::between, operator_family::range, &operators::between},
    {"$dateBefore", operator_kind::date_before, operator_family::date, &operators::date_before},
    {"$dateAfter", operator_kind::date_after, operator_family::date, &operators::date_after},
    {"$contains", operator_kind::contains, operator_family::string, &operators::contains},
    {"$startsWith", operator_kind::starts_with, operator_family::string, &operators::starts_with},
    {"$endsWith", operator_kind::ends_with, operator_family::string, &operators::ends_with},
}};

} // namespace

OperatorTable::OperatorTable(const evaluator_options& options)
    : patterns_(std::make_unique<cache::PatternCache>(options.pattern_cache_capacity,
                                                      options.pattern_cache_shards)),
      regex_subject_limit_(options.regex_max_subject_length) {
  for (const auto& b : kBuiltins) {
    entries_.emplace(std::string(b.name), operator_entry{std::string(b.name), b.kind, b.family, b.fn});
  }
}

auto OperatorTable::register_operator(std::string name, operator_handler handler)
    -> std::expected<void, core::error> {
  if (frozen_) {
    return std::unexpected(core::error{
        core::error_code::precondition_failed,
        "Operator table is frozen; register " + name + " before first evaluation",
        "operators.table"});
  }
  if (name.size() < 2 || name.front() != '$') {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "Operator name must start with '$': " + name, "operators.table"});
  }
  if (!handler) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "Empty handler for operator " + name, "operators.table"});
  }
  if (entries_.find(name) != entries_.end()) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "Operator already registered: " + name, "operators.table"});
  }
  auto key = name;
  entries_.emplace(std::move(key), operator_entry{std::move(name), operator_kind::custom,
                                                  operator_family::custom, std::move(handler)});
  return {};
}

auto OperatorTable::lookup(std::string_view name) const -> const operator_entry* {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

auto OperatorTable::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) out.push_back(name);
  return out;
}

auto to_string(operator_kind kind) noexcept -> std::string_view {
  for (const auto& b : kBuiltins) {
    if (b.kind == kind) return b.name;
  }
  return "custom";
}

} // namespace verdict
