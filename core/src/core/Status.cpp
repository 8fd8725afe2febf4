#include "pd/core/Status.hpp"

namespace pd {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                  return "None";
    case ErrorCode::DeviceUnavailable:     return "DeviceUnavailable";
    case ErrorCode::ContextCreationFailed: return "ContextCreationFailed";
    case ErrorCode::FontParseError:        return "FontParseError";
    case ErrorCode::PresentFailed:         return "PresentFailed";
    case ErrorCode::ConfigInvalid:         return "ConfigInvalid";
  }
  return "Unknown";
}

} // namespace pd
