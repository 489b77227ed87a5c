#include "SidecarFixture.hpp"

#include <cctype>
#include <stdexcept>

#include "utils/TrustedDigest.hpp"

using Axiom::Security::TrustedDigest;

namespace {
    const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

class TrustedDigestTest : public SidecarFixture {};

TEST_F(TrustedDigestTest, FromStringTrimsAndLowercases) {
    std::string upper = ABC_SHA256;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    auto d = TrustedDigest::fromString("  " + upper + "\n");
    EXPECT_EQ(d.hex(), ABC_SHA256);
}

TEST_F(TrustedDigestTest, RejectsMalformedValues) {
    EXPECT_THROW(TrustedDigest::fromString(""), std::invalid_argument);
    EXPECT_THROW(TrustedDigest::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(TrustedDigest::fromString(ABC_SHA256 + "0"), std::invalid_argument);
    EXPECT_THROW(TrustedDigest::fromString(std::string(63, 'a') + "z"), std::invalid_argument);
}

TEST_F(TrustedDigestTest, FromFileAcceptsTrailingNewline) {
    auto p = writeFile("trusted_sidecar.sha256", ABC_SHA256 + "\n", 0444);
    EXPECT_EQ(TrustedDigest::fromFile(p).hex(), ABC_SHA256);
}

TEST_F(TrustedDigestTest, FromFileMissingThrows) {
    EXPECT_THROW(TrustedDigest::fromFile(dir / "missing.sha256"), std::runtime_error);
}

TEST_F(TrustedDigestTest, MatchesIsCaseInsensitiveAndTrimmed) {
    auto d = TrustedDigest::fromString(ABC_SHA256);
    EXPECT_TRUE(d.matches(ABC_SHA256));
    EXPECT_TRUE(d.matches(" BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD \n"));
    EXPECT_FALSE(d.matches(std::string(64, '0')));
    EXPECT_FALSE(d.matches(""));
}

TEST(EmbeddedDigestTest, IsLoadedOnceAndWellFormed) {
    const auto& a = TrustedDigest::embedded();
    const auto& b = TrustedDigest::embedded();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.hex().size(), TrustedDigest::HEX_LENGTH);
}
