// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef SIDECAR_RUNNER_HPP
#define SIDECAR_RUNNER_HPP

#include <filesystem>
#include <string>

#include "core/IntegrityVerifier.hpp"
#include "core/InvocationTypes.hpp"
#include "telemetry/InvocationTelemetry.hpp"

namespace Axiom::Core {

    /**
     * @brief Ellenőrzött sidecar futtatás, egyetlen kérés/válasz csere.
     * Ha az integritás ellenőrzés nem sikerül, semmilyen folyamat nem indul.
     */
    class SidecarRunner {
    public:
        // Folyamat szintű alapértelmezés: beégetett digest + platform szerinti útvonal
        SidecarRunner();

        // Dependency Injection: tesztekben fixture digest és útvonal
        SidecarRunner(Security::TrustedDigest trusted, std::filesystem::path sidecarPath);

        /**
         * @brief Platformonként pontosan egy fix, relatív útvonal. Nincs keresés, nincs felülírás.
         */
        static std::filesystem::path resolveSidecarPath();

        /**
         * @brief verify -> spawn -> stdin írás + lezárás -> stdout gyűjtés a kilépésig -> veszteséges UTF-8 dekódolás.
         * A sidecar nem nulla kilépési kódja nem hiba, csak figyelmeztetés.
         */
        [[nodiscard]] InvocationResult run(const std::string& input, const RunOptions& options = {});

        const std::filesystem::path& sidecarPath() const { return path; }
        const IntegrityVerifier& integrityVerifier() const { return verifier; }

        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;

    private:
        IntegrityVerifier verifier;
        std::filesystem::path path;
        InvocationTelemetry telemetry;
    };
}

#endif
