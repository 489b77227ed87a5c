// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "telemetry/InvocationTelemetry.hpp"

namespace Axiom::Core {

void InvocationTelemetry::record_success(uint64_t payloadBytes, uint64_t outputBytes,
                                         std::chrono::milliseconds duration) {
    succeeded++;
    bytes_in += payloadBytes;
    bytes_out += outputBytes;
    last_duration_ms.store(static_cast<uint64_t>(duration.count()));
    // total utoljára: aki látja, a részletes számlálókat is látja
    total++;
}

void InvocationTelemetry::record_failure(SidecarErrorKind kind, std::chrono::milliseconds duration) {
    switch (kind) {
        case SidecarErrorKind::IntegrityCheckFailed: integrity_rejected++; break;
        case SidecarErrorKind::SpawnFailed:          spawn_failed++; break;
        case SidecarErrorKind::WriteFailed:          write_failed++; break;
        case SidecarErrorKind::WaitFailed:           wait_failed++; break;
        case SidecarErrorKind::TimedOut:             timed_out++; break;
        case SidecarErrorKind::Cancelled:            cancelled++; break;
    }
    last_duration_ms.store(static_cast<uint64_t>(duration.count()));
    total++;
}

TelemetrySnapshot InvocationTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.total              = total.load();
    snap.succeeded          = succeeded.load();
    snap.integrity_rejected = integrity_rejected.load();
    snap.spawn_failed       = spawn_failed.load();
    snap.write_failed       = write_failed.load();
    snap.wait_failed        = wait_failed.load();
    snap.timed_out          = timed_out.load();
    snap.cancelled          = cancelled.load();

    snap.bytes_in  = bytes_in.load();
    snap.bytes_out = bytes_out.load();

    snap.last_duration_ms = last_duration_ms.load();

    return snap;
}

} // namespace Axiom::Core
