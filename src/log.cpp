#include "verdict/core/log.hpp"

#include <iostream>
#include <mutex>
#include <string>

#include "verdict/core/platform_utils.hpp"

namespace verdict::core {

namespace {

std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}

auto write_line(std::string_view level, std::string_view component, std::string_view message) noexcept -> void {
  try {
    std::string line;
    line.reserve(component.size() + message.size() + 24);
    line.append("[verdict][").append(component).append("]");
    if (!level.empty()) line.append("[").append(level).append("]");
    line.append(" ").append(message).append("\n");
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << line << std::flush;
  } catch (const std::exception&) {
    // stderr is best-effort; a failed diagnostic must not fail an evaluation
  }
}

} // namespace

auto debug_enabled() noexcept -> bool {
  static const bool enabled = env_flag("VERDICT_DEBUG");
  return enabled;
}

auto log_warning(std::string_view component, std::string_view message) noexcept -> void {
  write_line("warn", component, message);
}

auto log_debug(std::string_view component, std::string_view message, bool force) noexcept -> void {
  if (!force && !debug_enabled()) return;
  write_line("", component, message);
}

} // namespace verdict::core
