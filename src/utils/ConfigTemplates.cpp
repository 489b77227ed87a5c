#include "utils/ConfigTemplates.hpp"

#ifndef AXIOM_TRUSTED_SIDECAR_SHA256
#error "AXIOM_TRUSTED_SIDECAR_SHA256 must be provided by the build (resources/trusted_sidecar.sha256)"
#endif

namespace AxiomTemplates {

    const std::string SIDECAR_PATH_WINDOWS = "sidecar/dist/main.exe";
    const std::string SIDECAR_PATH_POSIX   = "sidecar/dist/main";

    const std::string EMBEDDED_TRUSTED_DIGEST = AXIOM_TRUSTED_SIDECAR_SHA256;

    const std::string STERILE_PATH = "/usr/sbin:/usr/bin:/sbin:/bin";

    const std::vector<std::string> PURGED_ENV_VARS = {
        "LD_PRELOAD",
        "LD_LIBRARY_PATH",
        "LD_AUDIT",
        "PYTHONPATH",
        "PYTHONHOME",
        "PYTHONSTARTUP"
    };
}
