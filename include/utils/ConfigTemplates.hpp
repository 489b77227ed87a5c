#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <cstddef>
#include <vector>
#include <string>

namespace AxiomTemplates {

    // Sidecar artefaktum helye platformonként (relatív, nem konfigurálható)
    extern const std::string SIDECAR_PATH_WINDOWS;
    extern const std::string SIDECAR_PATH_POSIX;

    // A build által beégetett megbízható SHA-256 (CMake: AXIOM_TRUSTED_SIDECAR_SHA256)
    extern const std::string EMBEDDED_TRUSTED_DIGEST;

    // Hash olvasási blokk mérete (a fájl soha nem kerül egyben a memóriába)
    constexpr std::size_t DIGEST_CHUNK_SIZE = 64 * 1024;

    // Pipe olvasási puffer a gyerek stdout-jához
    constexpr std::size_t PIPE_READ_CHUNK = 16 * 1024;

    // A parancssorban megadható legnagyobb időkorlát (egy nap)
    constexpr long long MAX_TIMEOUT_MS = 24LL * 60 * 60 * 1000;

    // Gyerek folyamat környezete: fix PATH
    extern const std::string STERILE_PATH;

    // Kódinjekcióra alkalmas változók, amik nem juthatnak el a sidecarhoz
    extern const std::vector<std::string> PURGED_ENV_VARS;
}

#endif
