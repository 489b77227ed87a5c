// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include "utils/UniqueFd.hpp"

namespace Axiom::Core {

    /**
     * @brief Szálbiztos megszakítási jelzés egy futó sidecar híváshoz.
     * Egy eventfd-t is kezel, így a SafeExecutor poll() hurka azonnal felébred.
     */
    class CancellationToken {
    public:
        CancellationToken();

        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator=(const CancellationToken&) = delete;

        // Idempotens, bármelyik szálról hívható
        void cancel();

        bool isCancelled() const { return cancelled.load(); }

        // Olvashatóvá válik, amint cancel() lefutott
        int pollFd() const { return eventFd.get(); }

    private:
        std::atomic<bool> cancelled{false};
        AxiomUtils::UniqueFd eventFd;
    };
}

#endif
