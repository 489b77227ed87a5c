// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/SidecarRunner.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"

#include <chrono>
#include <iostream>

namespace Axiom::Core {

    namespace {
        std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
        }
    }

    SidecarRunner::SidecarRunner()
        : SidecarRunner(Security::TrustedDigest::embedded(), resolveSidecarPath()) {}

    SidecarRunner::SidecarRunner(Security::TrustedDigest trusted, std::filesystem::path sidecarPath)
        : verifier(std::move(trusted)), path(std::move(sidecarPath)) {}

    std::filesystem::path SidecarRunner::resolveSidecarPath() {
#ifdef _WIN32
        return std::filesystem::path(AxiomTemplates::SIDECAR_PATH_WINDOWS);
#else
        return std::filesystem::path(AxiomTemplates::SIDECAR_PATH_POSIX);
#endif
    }

    InvocationResult SidecarRunner::run(const std::string& input, const RunOptions& options) {
        const auto start = std::chrono::steady_clock::now();

        // 1. Supply-chain kapu: fail-closed
        auto outcome = verifier.inspect(path);
        if (outcome != VerificationOutcome::Verified) {
            std::cerr << "[SidecarRunner] Integrity check REJECTED " << path.string()
                      << " (" << toString(outcome) << "). Nothing spawned." << std::endl;
            telemetry.record_failure(SidecarErrorKind::IntegrityCheckFailed, elapsedSince(start));
            return InvocationResult::failure(SidecarErrorKind::IntegrityCheckFailed);
        }

        // 2. Csere a gyerek folyamattal
        ExchangeResult exchanged = SafeExecutor::exchange(path.string(), {}, input, options);
        if (exchanged.error) {
            std::cerr << "[SidecarRunner] " << exchanged.error->message() << std::endl;
            telemetry.record_failure(exchanged.error->kind, elapsedSince(start));
            return InvocationResult::failure(exchanged.error->kind, std::move(exchanged.error->detail));
        }

        if (exchanged.exitCode != 0) {
            std::cerr << "[WARN] Sidecar exited with status " << exchanged.exitCode
                      << ", returning its output anyway." << std::endl;
        }

        // 3. Veszteséges dekódolás: érvénytelen bájtsorozat -> U+FFFD, soha nem hiba
        std::string text = AxiomUtils::decodeUtf8Lossy(exchanged.output);

        telemetry.record_success(input.size(), exchanged.output.size(), elapsedSince(start));
        return InvocationResult::success(std::move(text));
    }

    TelemetrySnapshot SidecarRunner::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }
}
