#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace Axiom::Security {

/**
 * @brief A jóváhagyott sidecar bináris megbízható SHA-256 lenyomata.
 * Egyszer töltődik be, utána soha nem változik. A Verifier ezt kapja meg
 * paraméterként (tesztekben fixture digesttel helyettesíthető).
 */
class TrustedDigest {
public:
    static constexpr std::size_t HEX_LENGTH = 64;

    // Trim + kisbetűsítés + 64 hex számjegy ellenőrzés. Hibás érték: std::invalid_argument
    static TrustedDigest fromString(std::string_view text);

    // Csak olvasható erőforrás fájlból. Olvashatatlan fájl: std::runtime_error
    static TrustedDigest fromFile(const std::filesystem::path& path);

    // A build által beégetett érték, folyamat szinten egyetlen példány
    static const TrustedDigest& embedded();

    const std::string& hex() const { return value; }

    // Kis/nagybetű független, whitespace-trimmelt összehasonlítás
    bool matches(std::string_view computedHex) const;

private:
    explicit TrustedDigest(std::string normalized) : value(std::move(normalized)) {}

    std::string value;
};

} // namespace Axiom::Security
