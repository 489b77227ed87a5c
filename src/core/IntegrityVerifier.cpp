// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/IntegrityVerifier.hpp"
#include "utils/DigestUtils.hpp"

#include <system_error>

namespace Axiom::Core {

    const char* toString(VerificationOutcome outcome) {
        switch (outcome) {
            case VerificationOutcome::Verified:           return "VERIFIED";
            case VerificationOutcome::ArtifactMissing:    return "ARTIFACT_MISSING";
            case VerificationOutcome::ArtifactUnreadable: return "ARTIFACT_UNREADABLE";
            case VerificationOutcome::DigestMismatch:     return "DIGEST_MISMATCH";
        }
        return "UNKNOWN";
    }

    IntegrityVerifier::IntegrityVerifier(Security::TrustedDigest trusted)
        : trusted(std::move(trusted)) {}

    bool IntegrityVerifier::verify(const std::filesystem::path& path) const {
        return inspect(path) == VerificationOutcome::Verified;
    }

    VerificationOutcome IntegrityVerifier::inspect(const std::filesystem::path& path) const {
        auto computed = AxiomUtils::sha256File(path);

        if (!computed) {
            // Csak a diagnosztika kedvéért különböztetjük meg, a döntés ugyanaz
            std::error_code ec;
            bool exists = std::filesystem::exists(path, ec);
            return (!ec && !exists) ? VerificationOutcome::ArtifactMissing
                                    : VerificationOutcome::ArtifactUnreadable;
        }

        return trusted.matches(*computed) ? VerificationOutcome::Verified
                                          : VerificationOutcome::DigestMismatch;
    }
}
