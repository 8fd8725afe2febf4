#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace pd {

// Fatal causes the engine reports to its caller. Soft conditions
// (missing tag, missing glyph, unmapped key, empty chart range) are not
// errors and never produce one of these.
enum class ErrorCode : std::uint8_t {
  None = 0,
  DeviceUnavailable,
  ContextCreationFailed,
  FontParseError,
  PresentFailed,
  ConfigInvalid
};

const char* toString(ErrorCode code);

struct EngineError {
  ErrorCode code{ErrorCode::None};
  std::string message;  // human text, also logged to stderr
};

struct Status {
  bool ok{true};
  EngineError err{};

  static Status success() { return Status{}; }

  static Status fail(ErrorCode code, std::string message) {
    Status s;
    s.ok = false;
    s.err.code = code;
    s.err.message = std::move(message);
    return s;
  }
};

} // namespace pd
