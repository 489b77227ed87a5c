#ifndef AXIOM_INITIALIZER_HPP
#define AXIOM_INITIALIZER_HPP

#include <string>
#include <vector>

namespace Axiom::Init {
    /**
     * @brief Ellenőrzi, hogy a host root jogosultsággal fut-e (a sidecar ezt örökölné).
     */
    bool isRoot();

    /**
     * @brief A gyerek folyamat környezete "NAME=value" formában.
     * A host környezetéből indul, de a kódinjekcióra alkalmas változók (LD_PRELOAD, PYTHONPATH, ...)
     * kimaradnak, a PATH pedig fix értéket kap. A host környezete nem változik.
     */
    std::vector<std::string> sterileEnvironment();
}

#endif
