#pragma once

#include <cstdint>
#include <string_view>

namespace femtag {

// Fallible registry operations return an ErrorCode and leave state untouched
// on failure. Broken preconditions are bugs and are asserted instead.
enum class [[nodiscard]] ErrorCode : std::uint32_t {
  Success = 0,

  NotFound = 101,
  AlreadyExists = 104,

  InvalidArgument = 300,
  OutOfRange = 303,
};

constexpr std::string_view error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Success:         return "Success";
    case ErrorCode::NotFound:        return "NotFound";
    case ErrorCode::AlreadyExists:   return "AlreadyExists";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::OutOfRange:      return "OutOfRange";
  }
  return "Unknown";
}

constexpr bool ok(ErrorCode code) {
  return code == ErrorCode::Success;
}

} // namespace femtag
