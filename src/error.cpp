#include "verdict/error.hpp"

namespace verdict::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::missing_data: return "missing_data";
    case error_code::unknown_operator: return "unknown_operator";
    case error_code::type_mismatch: return "type_mismatch";
    case error_code::invalid_operand: return "invalid_operand";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace verdict::core
