// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/InvocationTypes.hpp"

#include <stdexcept>

namespace Axiom::Core {

    const char* toString(SidecarErrorKind kind) {
        switch (kind) {
            case SidecarErrorKind::IntegrityCheckFailed: return "IntegrityCheckFailed";
            case SidecarErrorKind::SpawnFailed:          return "SpawnFailed";
            case SidecarErrorKind::WriteFailed:          return "WriteFailed";
            case SidecarErrorKind::WaitFailed:           return "WaitFailed";
            case SidecarErrorKind::TimedOut:             return "TimedOut";
            case SidecarErrorKind::Cancelled:            return "Cancelled";
        }
        return "Unknown";
    }

    std::string SidecarError::message() const {
        std::string base;
        switch (kind) {
            case SidecarErrorKind::IntegrityCheckFailed: base = "Sidecar integrity check failed"; break;
            case SidecarErrorKind::SpawnFailed:          base = "Sidecar spawn failed"; break;
            case SidecarErrorKind::WriteFailed:          base = "Sidecar input write failed"; break;
            case SidecarErrorKind::WaitFailed:           base = "Sidecar wait failed"; break;
            case SidecarErrorKind::TimedOut:             base = "Sidecar timed out"; break;
            case SidecarErrorKind::Cancelled:            base = "Sidecar invocation cancelled"; break;
        }
        return detail.empty() ? base : base + ": " + detail;
    }

    InvocationResult InvocationResult::success(std::string output) {
        return InvocationResult(std::move(output));
    }

    InvocationResult InvocationResult::failure(SidecarErrorKind kind, std::string detail) {
        return InvocationResult(SidecarError{kind, std::move(detail)});
    }

    const std::string& InvocationResult::output() const {
        if (const auto* out = std::get_if<std::string>(&value)) {
            return *out;
        }
        throw std::logic_error("InvocationResult::output() on failed invocation: " + error().message());
    }

    const SidecarError& InvocationResult::error() const {
        if (const auto* err = std::get_if<SidecarError>(&value)) {
            return *err;
        }
        throw std::logic_error("InvocationResult::error() on successful invocation");
    }
}
