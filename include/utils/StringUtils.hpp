#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <string_view>

namespace AxiomUtils {
    /**
     * @brief Whitespace eltávolítása a szöveg elejéről és végéről (digest fájl tisztítás).
     */
    std::string trim(std::string_view s);

    /**
     * @brief ASCII kisbetűsítés. A nem-ASCII bájtokat érintetlenül hagyja.
     */
    std::string toLowerAscii(std::string_view s);

    /**
     * @brief Igaz, ha a szöveg pontosan `length` darab hexadecimális számjegy.
     */
    bool isHexString(std::string_view s, std::size_t length);

    /**
     * @brief Veszteséges UTF-8 dekódolás.
     * Minden érvénytelen (maximális) részsorozat helyére U+FFFD kerül,
     * így a dekódolás soha nem hibázik. Az eredeti bájtok ilyenkor elvesznek.
     */
    std::string decodeUtf8Lossy(std::string_view bytes);
}

#endif
