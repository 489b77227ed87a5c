// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/CancellationToken.hpp"

#include <cerrno>
#include <cstdint>
#include <sys/eventfd.h>
#include <system_error>
#include <unistd.h>

namespace Axiom::Core {

    CancellationToken::CancellationToken()
        : eventFd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
        if (!eventFd.valid()) {
            throw std::system_error(errno, std::system_category(), "eventfd");
        }
    }

    void CancellationToken::cancel() {
        if (cancelled.exchange(true)) return;

        uint64_t one = 1;
        // Teli számláló (EAGAIN) is olvashatót jelent, az eredmény ezért eldobható
        ssize_t rc;
        do {
            rc = ::write(eventFd.get(), &one, sizeof(one));
        } while (rc < 0 && errno == EINTR);
    }
}
