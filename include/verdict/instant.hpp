#pragma once

/** \file instant.hpp
 *  \brief Point-in-time parsing for the date operators.
 */

#include <chrono>
#include <optional>
#include <string_view>

#include "verdict/value.hpp"

namespace verdict {

using instant = std::chrono::sys_time<std::chrono::milliseconds>;

/** \brief Parse "YYYY-MM-DD" (midnight UTC) or
 *  "YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+hh:mm|-hh:mm]" (no suffix = UTC).
 */
auto parse_iso_instant(std::string_view text) -> std::optional<instant>;

/** \brief Interpret a value as an instant.
 *
 * Accepts ISO strings, integral epoch milliseconds and the token "now",
 * which resolves to the supplied clock reading.
 */
auto to_instant(const value& v, instant now) -> std::optional<instant>;

} // namespace verdict
