#pragma once

/** \file log.hpp
 *  \brief Tagged diagnostic lines on stderr: "[verdict][component] message".
 *
 * Warnings are always written. Debug lines are written only when VERDICT_DEBUG
 * is set (checked once per process) or when the caller passes force=true,
 * which evaluators do when evaluator_options::verbose is on.
 */

#include <string_view>

namespace verdict::core {

/** \brief Whether VERDICT_DEBUG enables debug lines for this process. */
[[nodiscard]] auto debug_enabled() noexcept -> bool;

/** \brief Write a warning line. Whole lines are written under a lock. */
auto log_warning(std::string_view component, std::string_view message) noexcept -> void;

/** \brief Write a debug line if debug output is enabled or force is set. */
auto log_debug(std::string_view component, std::string_view message, bool force = false) noexcept -> void;

} // namespace verdict::core
