#include "utils/StringUtils.hpp"

#include <cctype>

namespace AxiomUtils {

    namespace {
        constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

        bool isContinuation(unsigned char c) {
            return c >= 0x80 && c <= 0xBF;
        }
    }

    std::string trim(std::string_view s) {
        const char* ws = " \t\r\n\f\v";
        const auto first = s.find_first_not_of(ws);
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(ws);
        return std::string(s.substr(first, last - first + 1));
    }

    std::string toLowerAscii(std::string_view s) {
        std::string out(s);
        for (auto& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    bool isHexString(std::string_view s, std::size_t length) {
        if (s.size() != length) return false;
        for (unsigned char c : s) {
            if (!std::isxdigit(c)) return false;
        }
        return true;
    }

    std::string decodeUtf8Lossy(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());

        const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
        const std::size_t n = bytes.size();
        std::size_t i = 0;

        while (i < n) {
            const unsigned char lead = p[i];

            if (lead < 0x80) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            // Hossz és a második bájt megengedett tartománya (RFC 3629)
            std::size_t need = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                need = 2;
            } else if (lead == 0xE0) {
                need = 3; lo = 0xA0;
            } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
                need = 3;
            } else if (lead == 0xED) {
                need = 3; hi = 0x9F; // surrogate tartomány tiltva
            } else if (lead == 0xF0) {
                need = 4; lo = 0x90;
            } else if (lead >= 0xF1 && lead <= 0xF3) {
                need = 4;
            } else if (lead == 0xF4) {
                need = 4; hi = 0x8F;
            } else {
                out += REPLACEMENT_CHARACTER;
                ++i;
                continue;
            }

            std::size_t k = 1;
            if (i + 1 < n && p[i + 1] >= lo && p[i + 1] <= hi) {
                k = 2;
                while (k < need && i + k < n && isContinuation(p[i + k])) {
                    ++k;
                }
            }

            if (k == need) {
                out.append(bytes.substr(i, need));
            } else {
                out += REPLACEMENT_CHARACTER;
            }
            i += k;
        }

        return out;
    }
}
