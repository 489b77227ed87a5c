#pragma once

#include <cstdint>

namespace Axiom::Core {

struct TelemetrySnapshot {
    // --- Outcome Metrics ---
    uint64_t total;
    uint64_t succeeded;
    uint64_t integrity_rejected;
    uint64_t spawn_failed;
    uint64_t write_failed;
    uint64_t wait_failed;
    uint64_t timed_out;
    uint64_t cancelled;

    // --- Traffic Metrics ---
    uint64_t bytes_in;
    uint64_t bytes_out;

    uint64_t last_duration_ms;
};

} // namespace Axiom::Core
