// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate
// Invocation Types: error taxonomy and result of one sidecar call

#ifndef INVOCATION_TYPES_HPP
#define INVOCATION_TYPES_HPP

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "core/CancellationToken.hpp"

namespace Axiom::Core {

    /**
     * @brief Hol bukott el a hívás. Mindegyik végleges, nincs újrapróbálás.
     */
    enum class SidecarErrorKind {
        IntegrityCheckFailed, // digest eltérés vagy olvashatatlan artefaktum (fail-closed)
        SpawnFailed,
        WriteFailed,
        WaitFailed,
        TimedOut,
        Cancelled
    };

    const char* toString(SidecarErrorKind kind);

    struct SidecarError {
        SidecarErrorKind kind;
        std::string detail; // OS szintű leírás (strerror), ha van

        // A host felé továbbított, ember által olvasható hibaüzenet
        [[nodiscard]] std::string message() const;
    };

    /**
     * @brief Vagy a sidecar dekódolt stdout-ja, vagy egy SidecarError. Soha nem mindkettő.
     */
    class InvocationResult {
    public:
        static InvocationResult success(std::string output);
        static InvocationResult failure(SidecarErrorKind kind, std::string detail = {});

        [[nodiscard]] bool ok() const { return std::holds_alternative<std::string>(value); }

        // std::logic_error, ha a hívás hibával zárult
        const std::string& output() const;
        // std::logic_error, ha a hívás sikeres volt
        const SidecarError& error() const;

    private:
        explicit InvocationResult(std::variant<std::string, SidecarError> v) : value(std::move(v)) {}

        std::variant<std::string, SidecarError> value;
    };

    struct RunOptions {
        // 0 = nincs időkorlát
        std::chrono::milliseconds timeout{0};
        std::shared_ptr<CancellationToken> cancel;
    };
}

#endif // INVOCATION_TYPES_HPP
