#include "utils/AxiomInitializer.hpp"
#include "utils/ConfigTemplates.hpp"

#include <algorithm>
#include <string_view>
#include <unistd.h>

extern char** environ;

namespace Axiom::Init {

    bool isRoot() {
        return geteuid() == 0;
    }

    // T0 sterilizáció: egy ellenőrzött binárisba se lehessen loader szinten kódot injektálni
    std::vector<std::string> sterileEnvironment() {
        std::vector<std::string> env;

        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string_view::npos) continue;

            std::string_view name = kv.substr(0, eq);
            if (name == "PATH") continue;

            bool purged = std::any_of(AxiomTemplates::PURGED_ENV_VARS.begin(),
                                      AxiomTemplates::PURGED_ENV_VARS.end(),
                                      [name](const std::string& v) { return name == v; });
            if (!purged) {
                env.emplace_back(kv);
            }
        }

        // Fix, biztonságos PATH kényszerítése
        env.push_back("PATH=" + AxiomTemplates::STERILE_PATH);
        return env;
    }
}
