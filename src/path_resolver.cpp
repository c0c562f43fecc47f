#include "verdict/path_resolver.hpp"

namespace verdict {

namespace {

auto missing(std::string_view path) -> core::error {
  return core::error{core::error_code::missing_data, "Missing data at: " + std::string(path), "path"};
}

} // namespace

auto split_path(std::string_view path) -> std::vector<std::string_view> {
  std::vector<std::string_view> segments;
  std::size_t start = 0;
  while (true) {
    const auto dot = path.find('.', start);
    if (dot == std::string_view::npos) {
      segments.push_back(path.substr(start));
      return segments;
    }
    segments.push_back(path.substr(start, dot - start));
    start = dot + 1;
  }
}

auto resolve(const value& document, std::string_view path) -> std::expected<const value*, core::error> {
  const value* current = &document;
  for (const auto segment : split_path(path)) {
    if (!current->is_object()) {
      return std::unexpected(missing(path));
    }
    const auto& fields = current->as_object();
    auto it = fields.find(segment);
    if (it == fields.end()) {
      return std::unexpected(missing(path));
    }
    current = &it->second;
  }
  return current;
}

} // namespace verdict
