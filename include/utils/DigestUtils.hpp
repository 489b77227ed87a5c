// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef DIGEST_UTILS_HPP
#define DIGEST_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace AxiomUtils {

    /**
     * @brief SHA-256 egy fájl teljes tartalmára, blokkonként olvasva.
     * @return Kisbetűs hex digest, vagy std::nullopt ha a fájl nem nyitható / nem olvasható.
     */
    std::optional<std::string> sha256File(const std::filesystem::path& path);

    /**
     * @brief SHA-256 memóriában lévő adatra (kisbetűs hex).
     */
    std::string sha256Hex(std::string_view data);

    // Kisbetűs hexadecimális megjelenítés
    std::string toHex(const unsigned char* bytes, std::size_t len);
}

#endif
