// Repository: TelloLink
// Component: Failure Taxonomy
// Purpose: Source tags attached to errors surfaced by the session orchestrator.
// Copyright (c) 2026 TelloLink

#include "tellolink/core/Failure.h"

namespace tellolink::core {

const char* FailureSourceName(FailureSource source) {
  switch (source) {
    case FailureSource::kNone:
      return "none";
    case FailureSource::kNetwork:
      return "network";
    case FailureSource::kPermission:
      return "permission";
    case FailureSource::kTransport:
      return "transport";
    case FailureSource::kPipeline:
      return "pipeline";
    case FailureSource::kPlayback:
      return "playback";
  }
  return "unknown";
}

}  // namespace tellolink::core
