#include "SidecarFixture.hpp"

#include <sys/wait.h>

#include "core/IntegrityVerifier.hpp"

using Axiom::Core::IntegrityVerifier;
using Axiom::Core::VerificationOutcome;

class IntegrityVerifierTest : public SidecarFixture {};

TEST_F(IntegrityVerifierTest, MatchingArtifactVerifies) {
    auto p = writeStub("main", "exec cat\n");
    IntegrityVerifier verifier(digestOf(p));

    EXPECT_TRUE(verifier.verify(p));
    EXPECT_EQ(verifier.inspect(p), VerificationOutcome::Verified);
}

TEST_F(IntegrityVerifierTest, AnySingleByteMutationIsRejected) {
    const std::string original = "#!/bin/sh\nexec cat\n";
    auto p = writeFile("main", original);
    IntegrityVerifier verifier(digestOf(p));
    ASSERT_TRUE(verifier.verify(p));

    for (std::size_t i = 0; i < original.size(); ++i) {
        std::string mutated = original;
        mutated[i] = static_cast<char>(mutated[i] ^ 0x01);
        writeFile("main", mutated);
        EXPECT_FALSE(verifier.verify(p)) << "mutation at byte " << i;
        EXPECT_EQ(verifier.inspect(p), VerificationOutcome::DigestMismatch);
    }

    writeFile("main", original);
    EXPECT_TRUE(verifier.verify(p));
}

TEST_F(IntegrityVerifierTest, MissingArtifactIsRejectedWithoutThrowing) {
    auto p = writeStub("main", "exec cat\n");
    IntegrityVerifier verifier(digestOf(p));
    fs::remove(p);

    bool ok = true;
    EXPECT_NO_THROW(ok = verifier.verify(p));
    EXPECT_FALSE(ok);
    EXPECT_EQ(verifier.inspect(p), VerificationOutcome::ArtifactMissing);
}

// Root alatt a jogosultság bitek nem számítanak: egy gyerek folyamat nobody-ként vizsgál
static int inspectWithoutPrivileges(const IntegrityVerifier& verifier, const fs::path& p) {
    if (::geteuid() != 0) {
        return static_cast<int>(verifier.inspect(p));
    }
    pid_t pid = ::fork();
    if (pid == 0) {
        if (::setgid(65534) != 0 || ::setuid(65534) != 0) _exit(100);
        _exit(static_cast<int>(verifier.inspect(p)));
    }
    int status = 0;
    if (pid < 0 || ::waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

TEST_F(IntegrityVerifierTest, UnreadableArtifactIsRejected) {
    IntegrityVerifier verifier(Axiom::Security::TrustedDigest::fromString(std::string(64, 'a')));

    // könyvtár: megnyitható, de nem olvasható fájlként
    EXPECT_FALSE(verifier.verify(dir));
    EXPECT_EQ(verifier.inspect(dir), VerificationOutcome::ArtifactUnreadable);

    // az open() ENOTDIR-rel bukik: egy fájl nem lehet útvonal köztes eleme
    auto plain = writeFile("plain", "data", 0644);
    EXPECT_FALSE(verifier.verify(plain / "main"));
    EXPECT_EQ(verifier.inspect(plain / "main"), VerificationOutcome::ArtifactUnreadable);

    // az open() ELOOP-pal bukik
    fs::create_symlink(dir / "loop", dir / "loop");
    EXPECT_FALSE(verifier.verify(dir / "loop"));
    EXPECT_EQ(verifier.inspect(dir / "loop"), VerificationOutcome::ArtifactUnreadable);
}

TEST_F(IntegrityVerifierTest, PermissionDeniedArtifactIsUnreadable) {
    auto p = writeStub("locked", "exec cat\n", 0000);
    IntegrityVerifier verifier(Axiom::Security::TrustedDigest::fromString(std::string(64, 'a')));

    EXPECT_EQ(inspectWithoutPrivileges(verifier, p), static_cast<int>(VerificationOutcome::ArtifactUnreadable));
}

TEST_F(IntegrityVerifierTest, VerificationIsDeterministic) {
    auto p = writeStub("main", "exec cat\n");
    IntegrityVerifier good(digestOf(p));
    IntegrityVerifier bad(Axiom::Security::TrustedDigest::fromString(std::string(64, 'f')));

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(good.verify(p));
        EXPECT_FALSE(bad.verify(p));
    }
}

TEST_F(IntegrityVerifierTest, EmptyArtifactMatchesZeroByteDigest) {
    auto p = writeFile("empty", "", 0644);
    IntegrityVerifier verifier(Axiom::Security::TrustedDigest::fromString(
        "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855\n"));
    EXPECT_TRUE(verifier.verify(p));
}
