#include "SidecarFixture.hpp"

#include <chrono>
#include <stdexcept>

#include "core/SidecarRunner.hpp"

using namespace Axiom::Core;
using namespace std::chrono_literals;

class SidecarRunnerTest : public SidecarFixture {};

TEST_F(SidecarRunnerTest, TrustedEchoStubReturnsItsInput) {
    auto p = writeStub("main", "exec cat\n");
    SidecarRunner runner(digestOf(p), p);

    auto result = runner.run("hello");
    ASSERT_TRUE(result.ok()) << result.error().message();
    EXPECT_EQ(result.output(), "hello");
}

TEST_F(SidecarRunnerTest, ReplacedArtifactOfSameSizeNeverRuns) {
    auto marker = dir / "pwned";
    std::string trusted = "#!/bin/sh\nexec cat\n";
    std::string impostor = "#!/bin/sh\ntouch '" + marker.string() + "'\n";
    padToSameSize(trusted, impostor);
    ASSERT_EQ(trusted.size(), impostor.size());

    auto p = writeFile("main", trusted);
    SidecarRunner runner(digestOf(p), p);
    writeFile("main", impostor);

    auto result = runner.run("hello");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SidecarErrorKind::IntegrityCheckFailed);
    EXPECT_EQ(result.error().message(), "Sidecar integrity check failed");
    EXPECT_FALSE(fs::exists(marker));
}

TEST_F(SidecarRunnerTest, UnverifiedStubLeavesNoSideEffect) {
    auto marker = dir / "marker";
    auto p = writeStub("main", "cat >/dev/null\ntouch '" + marker.string() + "'\n");
    SidecarRunner runner(Axiom::Security::TrustedDigest::fromString(std::string(64, '0')), p);

    EXPECT_FALSE(runner.integrityVerifier().verify(p));
    auto result = runner.run("anything");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SidecarErrorKind::IntegrityCheckFailed);
    EXPECT_FALSE(fs::exists(marker));

    // ugyanez a stub megbízható digesttel lefut és létrehozza a markert
    SidecarRunner trustedRunner(digestOf(p), p);
    ASSERT_TRUE(trustedRunner.run("anything").ok());
    EXPECT_TRUE(fs::exists(marker));
}

TEST_F(SidecarRunnerTest, MissingArtifactIsIntegrityFailure) {
    SidecarRunner runner(Axiom::Security::TrustedDigest::fromString(std::string(64, '0')), dir / "main");
    auto result = runner.run("hello");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SidecarErrorKind::IntegrityCheckFailed);
}

TEST_F(SidecarRunnerTest, NonExecutableArtifactIsSpawnFailure) {
    auto p = writeStub("main", "exec cat\n", 0644);
    SidecarRunner runner(digestOf(p), p);

    auto result = runner.run("hello");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SidecarErrorKind::SpawnFailed);
    EXPECT_NE(result.error().message().find("Sidecar spawn failed: "), std::string::npos);
}

TEST_F(SidecarRunnerTest, InvalidUtf8OutputIsDecodedLossily) {
    auto p = writeStub("main", "cat >/dev/null\nprintf '\\377ok\\303\\251'\n");
    SidecarRunner runner(digestOf(p), p);

    auto result = runner.run("ignored");
    ASSERT_TRUE(result.ok()) << result.error().message();
    EXPECT_EQ(result.output(), "\xEF\xBF\xBDok\xC3\xA9");
}

TEST_F(SidecarRunnerTest, NonZeroExitStillReturnsOutput) {
    auto p = writeStub("main", "cat\nexit 4\n");
    SidecarRunner runner(digestOf(p), p);

    auto result = runner.run("partial");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.output(), "partial");
}

TEST_F(SidecarRunnerTest, TimeoutIsReportedAsTimedOut) {
    auto p = writeStub("main", "exec sleep 30\n");
    SidecarRunner runner(digestOf(p), p);

    RunOptions options;
    options.timeout = 200ms;
    auto result = runner.run("", options);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SidecarErrorKind::TimedOut);
}

TEST_F(SidecarRunnerTest, TelemetryCountsEveryOutcome) {
    auto p = writeStub("main", "exec cat\n");
    SidecarRunner runner(digestOf(p), p);

    ASSERT_TRUE(runner.run("abc").ok());
    ASSERT_TRUE(runner.run("de").ok());
    writeStub("main", "exec cat # tampered\n");
    ASSERT_FALSE(runner.run("abc").ok());

    auto snap = runner.getTelemetrySnapshot();
    EXPECT_EQ(snap.total, 3u);
    EXPECT_EQ(snap.succeeded, 2u);
    EXPECT_EQ(snap.integrity_rejected, 1u);
    EXPECT_EQ(snap.spawn_failed, 0u);
    EXPECT_EQ(snap.bytes_in, 5u);
    EXPECT_EQ(snap.bytes_out, 5u);
}

TEST(SidecarPathTest, ResolvesFixedRelativePath) {
    auto p = SidecarRunner::resolveSidecarPath();
    EXPECT_TRUE(p.is_relative());
    EXPECT_EQ(p, fs::path("sidecar/dist/main"));
}

TEST(InvocationResultTest, AccessorsGuardTheWrongAlternative) {
    auto ok = InvocationResult::success("out");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.output(), "out");
    EXPECT_THROW(ok.error(), std::logic_error);

    auto bad = InvocationResult::failure(SidecarErrorKind::WaitFailed, "No child processes");
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().message(), "Sidecar wait failed: No child processes");
    EXPECT_THROW(bad.output(), std::logic_error);
}
