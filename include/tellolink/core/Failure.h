// Repository: TelloLink
// Component: Failure Taxonomy
// Purpose: Source tags attached to errors surfaced by the session orchestrator.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_CORE_FAILURE_H_
#define TELLOLINK_CORE_FAILURE_H_

namespace tellolink::core {

// Which component raised an error. Derived from the component that reported
// the failing event; the message itself is free text for display.
enum class FailureSource {
  kNone = 0,
  kNetwork = 1,     // preflight: no link, wrong link type, wrong network
  kPermission = 2,  // wireless identity access denied
  kTransport = 3,   // command channel bind/send/receive, acknowledgment
  kPipeline = 4,    // transcode launch or runtime failure
  kPlayback = 5,    // renderer-reported load/decode error (advisory)
};

const char* FailureSourceName(FailureSource source);

}  // namespace tellolink::core

#endif  // TELLOLINK_CORE_FAILURE_H_
