// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate
// Invocation Scheduler: async, cancellable sidecar calls on dedicated workers

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include "rxcpp/rx.hpp" // A reaktív motor

#include "core/InvocationTypes.hpp"

namespace Axiom::Core {

    class SidecarRunner; // Forward declaration

    /**
     * @brief A worker szálak és a scheduler közös állapota.
     * A `closed` után induló worker már nem éri el a runnert; a stop() az `active` nullázódását várja.
     */
    struct InFlightState {
        std::mutex mtx;
        std::condition_variable idle;
        std::size_t active = 0;
        bool closed = false;
    };

    /**
     * @brief A blokkoló SidecarRunner::run aszinkron, megszakítható burka.
     * Minden hívás saját worker szálon fut, a hívó szála szabad marad.
     */
    class InvocationScheduler {
    private:
        // --- State ---
        std::atomic<bool> running{true};

        // A fő subscription: stop() esetén minden futó hívás tokenje megszakad
        rxcpp::composite_subscription lifetime;

        // Dedikált szál hívásonként (make_new_thread)
        rxcpp::schedulers::scheduler worker_scheduler;

        std::shared_ptr<InFlightState> inFlight;

        SidecarRunner& runner;

    public:
        explicit InvocationScheduler(SidecarRunner& runnerRef);
        ~InvocationScheduler();

        InvocationScheduler(const InvocationScheduler&) = delete;
        InvocationScheduler& operator=(const InvocationScheduler&) = delete;

        /**
         * @brief Hideg observable: feliratkozáskor indul, pontosan egy InvocationResult, majd on_completed.
         * Leiratkozás befejezés előtt megszakítja a hívást (a gyerek SIGKILL-t kap).
         */
        rxcpp::observable<InvocationResult> submit(std::string input,
                                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

        // Blokkoló híd a submit fölött
        InvocationResult invoke(std::string input,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

        // Megszakít minden futó hívást, és megvárja, amíg egyik worker sem használja a runnert
        void stop();

        std::size_t inFlightCount() const;

        bool isRunning() const { return running.load(); }
    };
}

#endif // SCHEDULER_HPP
