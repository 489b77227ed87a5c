// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/Scheduler.hpp"
#include "core/SidecarRunner.hpp"
#include <iostream>
#include <memory>

namespace Axiom::Core {

    namespace {
        // A runner használatának idejére számolja a workert; a destruktor mindig csökkent
        class InFlightGuard {
        public:
            explicit InFlightGuard(std::shared_ptr<InFlightState> state) : state(std::move(state)) {
                std::lock_guard<std::mutex> lock(this->state->mtx);
                if (!this->state->closed) {
                    ++this->state->active;
                    admitted = true;
                }
            }

            ~InFlightGuard() { release(); }

            InFlightGuard(const InFlightGuard&) = delete;
            InFlightGuard& operator=(const InFlightGuard&) = delete;

            bool isAdmitted() const { return admitted; }

            void release() {
                if (!admitted) return;
                admitted = false;
                std::lock_guard<std::mutex> lock(state->mtx);
                if (--state->active == 0) {
                    state->idle.notify_all();
                }
            }

        private:
            std::shared_ptr<InFlightState> state;
            bool admitted = false;
        };
    }

    InvocationScheduler::InvocationScheduler(SidecarRunner& runnerRef)
        : worker_scheduler(rxcpp::schedulers::make_new_thread()),
          inFlight(std::make_shared<InFlightState>()),
          runner(runnerRef) {}

    InvocationScheduler::~InvocationScheduler() {
        stop();
    }

    rxcpp::observable<InvocationResult> InvocationScheduler::submit(std::string input,
                                                                    std::chrono::milliseconds timeout) {
        SidecarRunner* target = &runner;
        auto workers = worker_scheduler;
        auto schedulerLifetime = lifetime;
        auto state = inFlight;

        return rxcpp::observable<>::create<InvocationResult>(
            [target, workers, schedulerLifetime, state, input = std::move(input), timeout](rxcpp::subscriber<InvocationResult> s) {
                auto token = std::make_shared<CancellationToken>();
                auto stopHook = schedulerLifetime.add(rxcpp::make_subscription([token]() { token->cancel(); }));

                // A hook közvetlenül a subscriber-en ül: a leiratkozó szálán azonnal lefut,
                // nem várja meg a (blokkolt) worker-t. A stopHook akkor is kikerül, ha a worker el sem indult.
                s.add(rxcpp::make_subscription([token, schedulerLifetime, stopHook]() {
                    token->cancel();
                    schedulerLifetime.remove(stopHook);
                }));

                rxcpp::observable<>::create<InvocationResult>(
                    [target, input, timeout, token, state, schedulerLifetime, stopHook](rxcpp::subscriber<InvocationResult> inner) {
                        InFlightGuard guard(state);
                        if (!guard.isAdmitted()) {
                            schedulerLifetime.remove(stopHook);
                            inner.on_next(InvocationResult::failure(SidecarErrorKind::Cancelled, "scheduler stopped"));
                            inner.on_completed();
                            return;
                        }

                        RunOptions options;
                        options.timeout = timeout;
                        options.cancel = token;

                        auto result = target->run(input, options);
                        schedulerLifetime.remove(stopHook);
                        guard.release();

                        inner.on_next(std::move(result));
                        inner.on_completed();
                    })
                    .subscribe_on(rxcpp::observe_on_one_worker(workers))
                    .subscribe(s);
            });
    }

    InvocationResult InvocationScheduler::invoke(std::string input, std::chrono::milliseconds timeout) {
        return submit(std::move(input), timeout).as_blocking().first();
    }

    void InvocationScheduler::stop() {
        {
            std::lock_guard<std::mutex> lock(inFlight->mtx);
            inFlight->closed = true;
        }

        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }

        {
            std::unique_lock<std::mutex> lock(inFlight->mtx);
            inFlight->idle.wait(lock, [this] { return inFlight->active == 0; });
        }

        if (running.exchange(false)) {
            std::clog << "[Scheduler] Stopped, in-flight sidecar calls cancelled." << std::endl;
        }
    }

    std::size_t InvocationScheduler::inFlightCount() const {
        std::lock_guard<std::mutex> lock(inFlight->mtx);
        return inFlight->active;
    }
}
