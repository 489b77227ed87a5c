// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef SAFE_EXECUTOR_HPP
#define SAFE_EXECUTOR_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/InvocationTypes.hpp"

namespace Axiom::Core {

    /**
     * @brief Egy lefutott csere eredménye. Hibánál az `output` a hiba pillanatáig gyűlt bájtokat tartalmazza.
     */
    struct ExchangeResult {
        std::optional<SidecarError> error;
        std::string output;  // nyers stdout bájtok, dekódolás nélkül
        int exitCode = -1;   // WEXITSTATUS, jelzésnél 128 + signo
    };

    class SafeExecutor {
    public:
        /**
         * @brief A "Prepared Statement" logika: bináris és argumentum vektor szétválasztva, shell nélkül (fork/execve).
         * A payload a gyerek stdin-jére megy, utána a stdin lezárul; a stdout a kilépésig gyűlik.
         * A stderr öröklődik, nem kerül rögzítésre. A környezet sterilizált (Init::sterileEnvironment).
         * Időtúllépés vagy megszakítás esetén a gyerek SIGKILL-t kap; a gyerek minden ágon begyűjtésre kerül.
         */
        static ExchangeResult exchange(const std::string& binary,
                                       const std::vector<std::string>& args,
                                       std::string_view payload,
                                       const RunOptions& options = {});
    };
}

#endif
