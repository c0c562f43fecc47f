#pragma once

/** \file path_resolver.hpp
 *  \brief Dot-separated field path resolution over a document value tree.
 *
 * Traversal only descends through objects. Arrays and scalars are terminal:
 * "tags.0" never indexes into an array. A present key holding null resolves
 * to that null value; only absent keys (or a non-object on the way) are missing.
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/error.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Resolve path against document.
 *
 * \return Pointer into document (valid while document lives), or a
 *         missing_data error whose message names the full original path.
 *
 * Thread-safety: pure function over const data.
 */
auto resolve(const value& document, std::string_view path) -> std::expected<const value*, core::error>;

/** \brief Split "a.b.c" into {"a", "b", "c"}; empty segments are preserved. */
auto split_path(std::string_view path) -> std::vector<std::string_view>;

} // namespace verdict
