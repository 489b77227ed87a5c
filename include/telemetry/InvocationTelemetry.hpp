#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "core/InvocationTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Axiom::Core {

struct InvocationTelemetry {
    // Hívás számlálók
    std::atomic<uint64_t> total{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> integrity_rejected{0};
    std::atomic<uint64_t> spawn_failed{0};
    std::atomic<uint64_t> write_failed{0};
    std::atomic<uint64_t> wait_failed{0};
    std::atomic<uint64_t> timed_out{0};
    std::atomic<uint64_t> cancelled{0};

    // Forgalom
    std::atomic<uint64_t> bytes_in{0};
    std::atomic<uint64_t> bytes_out{0};

    std::atomic<uint64_t> last_duration_ms{0};

    void record_success(uint64_t payloadBytes, uint64_t outputBytes, std::chrono::milliseconds duration);
    void record_failure(SidecarErrorKind kind, std::chrono::milliseconds duration);

    [[nodiscard]] TelemetrySnapshot snapshot() const;
};

} // namespace Axiom::Core
