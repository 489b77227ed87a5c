// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "utils/DigestUtils.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/UniqueFd.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace AxiomUtils {

    namespace {
        struct EvpMdCtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

        EvpMdCtxPtr newSha256Context() {
            EvpMdCtxPtr ctx(EVP_MD_CTX_new());
            if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
                return nullptr;
            }
            return ctx;
        }

        std::optional<std::string> finalizeHex(EVP_MD_CTX* ctx) {
            unsigned char out[EVP_MAX_MD_SIZE];
            unsigned int outLen = 0;
            if (EVP_DigestFinal_ex(ctx, out, &outLen) != 1) {
                return std::nullopt;
            }
            return toHex(out, outLen);
        }
    }

    std::string toHex(const unsigned char* bytes, std::size_t len) {
        static const char* digits = "0123456789abcdef";
        std::string s;
        s.reserve(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            s.push_back(digits[(bytes[i] >> 4) & 0x0F]);
            s.push_back(digits[bytes[i] & 0x0F]);
        }
        return s;
    }

    std::optional<std::string> sha256File(const std::filesystem::path& path) {
        UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!fd.valid()) {
            return std::nullopt;
        }

        auto ctx = newSha256Context();
        if (!ctx) {
            return std::nullopt;
        }

        std::vector<unsigned char> buf(AxiomTemplates::DIGEST_CHUNK_SIZE);
        while (true) {
            ssize_t n = ::read(fd.get(), buf.data(), buf.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                return std::nullopt; // I/O hiba (pl. EISDIR, EIO)
            }
            if (n == 0) break;
            if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
                return std::nullopt;
            }
        }

        return finalizeHex(ctx.get());
    }

    std::string sha256Hex(std::string_view data) {
        auto ctx = newSha256Context();
        if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("EVP SHA-256 init/update failed");
        }
        auto hex = finalizeHex(ctx.get());
        if (!hex) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return *hex;
    }
}
