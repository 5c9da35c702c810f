// Repository: loopcast
// Component: Error Taxonomy
// Copyright (c) 2026 Loopcast

#include "loopcast/Errors.hpp"

namespace loopcast {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "none";
    case ErrorKind::kConfigError: return "ConfigError";
    case ErrorKind::kSourceUnavailable: return "SourceUnavailable";
    case ErrorKind::kSourceEmpty: return "SourceEmpty";
    case ErrorKind::kItemUnresolvable: return "ItemUnresolvable";
    case ErrorKind::kStreamProcessCrash: return "StreamProcessCrash";
    case ErrorKind::kShutdownRequested: return "ShutdownRequested";
  }
  return "unknown";
}

}  // namespace loopcast
