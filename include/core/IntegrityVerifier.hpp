// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef INTEGRITY_VERIFIER_HPP
#define INTEGRITY_VERIFIER_HPP

#include <filesystem>
#include "utils/TrustedDigest.hpp"

namespace Axiom::Core {

    /**
     * @brief Diagnosztikai eredmény. A végrehajtás szempontjából csak a
     * Verified engedélyez, minden más elutasítás (fail-closed).
     */
    enum class VerificationOutcome {
        Verified,
        ArtifactMissing,
        ArtifactUnreadable,
        DigestMismatch
    };

    const char* toString(VerificationOutcome outcome);

    /**
     * @brief Supply-chain kapu: a lemezen lévő artefaktum pontosan a jóváhagyott bináris-e?
     * Állapotmentes, a megbízható digestet konstruktorban kapja.
     */
    class IntegrityVerifier {
    public:
        explicit IntegrityVerifier(Security::TrustedDigest trusted);

        /**
         * @brief Igaz, ha a fájl megnyitható, végigolvasható és a SHA-256 egyezik.
         * Soha nem dob kivételt; hiányzó fájl és eltérő hash egyaránt false.
         */
        [[nodiscard]] bool verify(const std::filesystem::path& path) const;

        // Ugyanaz a számítás, de megmondja, miért bukott el (csak naplózáshoz)
        [[nodiscard]] VerificationOutcome inspect(const std::filesystem::path& path) const;

    private:
        Security::TrustedDigest trusted;
    };
}

#endif
