#include "utils/TrustedDigest.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace Axiom::Security {

TrustedDigest TrustedDigest::fromString(std::string_view text) {
    std::string normalized = AxiomUtils::toLowerAscii(AxiomUtils::trim(text));
    if (!AxiomUtils::isHexString(normalized, HEX_LENGTH)) {
        throw std::invalid_argument("Trusted digest must be 64 hex digits, got: '" + normalized + "'");
    }
    return TrustedDigest(std::move(normalized));
}

TrustedDigest TrustedDigest::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read trusted digest resource: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("I/O error while reading trusted digest resource: " + path.string());
    }
    return fromString(content);
}

const TrustedDigest& TrustedDigest::embedded() {
    static const TrustedDigest inst = fromString(AxiomTemplates::EMBEDDED_TRUSTED_DIGEST);
    return inst;
}

bool TrustedDigest::matches(std::string_view computedHex) const {
    return AxiomUtils::toLowerAscii(AxiomUtils::trim(computedHex)) == value;
}

} // namespace Axiom::Security
