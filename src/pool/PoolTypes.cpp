// Repository: Probekit-core
// Component: Resource Pool Types
// Purpose: String forms for pool enums (logging).
// Copyright (c) 2025 Probekit

#include "probekit/pool/PoolTypes.hpp"

namespace probekit::pool {

const char* DestroyReasonToString(DestroyReason reason) {
  switch (reason) {
    case DestroyReason::kResetFailed: return "reset_failed";
    case DestroyReason::kIdleEviction: return "idle_eviction";
    case DestroyReason::kPressureEviction: return "pressure_eviction";
    case DestroyReason::kShutdown: return "shutdown";
  }
  return "unknown";
}

}  // namespace probekit::pool
