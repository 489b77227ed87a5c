// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "core/SafeExecutor.hpp"
#include "utils/AxiomInitializer.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/UniqueFd.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace Axiom::Core {

    namespace {
        using AxiomUtils::UniqueFd;
        using Clock = std::chrono::steady_clock;

        std::string osError(int err) {
            return std::system_category().message(err);
        }

        bool makePipe(UniqueFd& readEnd, UniqueFd& writeEnd) {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) == -1) return false;
            readEnd.reset(fds[0]);
            writeEnd.reset(fds[1]);
            return true;
        }

        bool setNonBlocking(int fd) {
            int flags = ::fcntl(fd, F_GETFL);
            return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
        }

        class Deadline {
        public:
            explicit Deadline(std::chrono::milliseconds timeout) : limit(timeout) {
                if (timeout.count() > 0) {
                    // Az óra tartományán túli határidő gyakorlatilag végtelen: nincs deadline
                    auto now = Clock::now();
                    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
                    if (timeout < headroom) {
                        deadline = now + timeout;
                    }
                }
            }

            bool bounded() const { return deadline.has_value(); }
            bool expired() const { return deadline && Clock::now() >= *deadline; }

            // poll() timeout: -1 ha nincs határidő
            int remainingMillis() const {
                if (!deadline) return -1;
                auto now = Clock::now();
                if (now >= *deadline) return 0;
                auto rem = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count();
                return static_cast<int>(std::min<long long>(rem, INT_MAX));
            }

            std::string describe() const {
                return "exceeded " + std::to_string(limit.count()) + " ms";
            }

        private:
            std::chrono::milliseconds limit;
            std::optional<Clock::time_point> deadline;
        };

        /**
         * @brief A stdin írás idejére blokkolja a SIGPIPE-ot a hívó szálon.
         * A write() így EPIPE-pel tér vissza a folyamat leállítása helyett; a függő jelet elnyeljük.
         */
        class SigpipeGuard {
        public:
            SigpipeGuard() {
                sigemptyset(&pipeSet);
                sigaddset(&pipeSet, SIGPIPE);

                sigset_t pending;
                sigemptyset(&pending);
                alreadyPending = (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1);
                blocked = (pthread_sigmask(SIG_BLOCK, &pipeSet, &previous) == 0);
            }

            ~SigpipeGuard() {
                if (!blocked) return;
                if (!alreadyPending) {
                    sigset_t pending;
                    sigemptyset(&pending);
                    if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                        const timespec zero{0, 0};
                        int rc;
                        do {
                            rc = sigtimedwait(&pipeSet, nullptr, &zero);
                        } while (rc < 0 && errno == EINTR);
                    }
                }
                pthread_sigmask(SIG_SETMASK, &previous, nullptr);
            }

            SigpipeGuard(const SigpipeGuard&) = delete;
            SigpipeGuard& operator=(const SigpipeGuard&) = delete;

        private:
            sigset_t pipeSet;
            sigset_t previous;
            bool alreadyPending = false;
            bool blocked = false;
        };

        // Gyerek oldal: csak async-signal-safe hívások
        [[noreturn]] void reportAndExit(int statusFd, int err) {
            ssize_t rc;
            do {
                rc = ::write(statusFd, &err, sizeof(err));
            } while (rc < 0 && errno == EINTR);
            _exit(127);
        }

        bool wireStream(int fd, int target) {
            if (fd == target) {
                // dup2 ugyanarra az fd-re nem törli a CLOEXEC-et
                return ::fcntl(fd, F_SETFD, 0) != -1;
            }
            return ::dup2(fd, target) != -1;
        }

        int waitBlocking(pid_t pid, int& status) {
            pid_t r;
            do {
                r = ::waitpid(pid, &status, 0);
            } while (r < 0 && errno == EINTR);
            return r < 0 ? errno : 0;
        }

        void killAndReap(pid_t pid) {
            ::kill(pid, SIGKILL);
            int status = 0;
            waitBlocking(pid, status);
        }

        int decodeExitStatus(int status) {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return -1;
        }

        /**
         * @brief Várakozás a gyerek kilépésére határidővel / megszakítással.
         * Határidő és token nélkül egyszerű blokkoló waitpid.
         */
        std::optional<SidecarError> waitForExit(pid_t pid, const Deadline& deadline,
                                                const CancellationToken* cancel, int& status) {
            if (!deadline.bounded() && cancel == nullptr) {
                int err = waitBlocking(pid, status);
                if (err != 0) return SidecarError{SidecarErrorKind::WaitFailed, osError(err)};
                return std::nullopt;
            }

            constexpr int SLICE_MS = 10;
            while (true) {
                pid_t r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) return std::nullopt;
                if (r < 0) {
                    if (errno == EINTR) continue;
                    return SidecarError{SidecarErrorKind::WaitFailed, osError(errno)};
                }

                if (cancel && cancel->isCancelled()) {
                    return SidecarError{SidecarErrorKind::Cancelled, "cancelled while waiting for exit"};
                }
                if (deadline.expired()) {
                    return SidecarError{SidecarErrorKind::TimedOut, deadline.describe()};
                }

                int slice = SLICE_MS;
                if (deadline.bounded()) slice = std::min(slice, deadline.remainingMillis());

                if (cancel) {
                    pollfd pfd{cancel->pollFd(), POLLIN, 0};
                    ::poll(&pfd, 1, slice);
                } else {
                    ::poll(nullptr, 0, slice);
                }
            }
        }
    }

    ExchangeResult SafeExecutor::exchange(const std::string& binary,
                                          const std::vector<std::string>& args,
                                          std::string_view payload,
                                          const RunOptions& options) {
        ExchangeResult result;
        const CancellationToken* cancel = options.cancel.get();

        if (cancel && cancel->isCancelled()) {
            result.error = SidecarError{SidecarErrorKind::Cancelled, "cancelled before spawn"};
            return result;
        }

        UniqueFd stdinRead, stdinWrite, stdoutRead, stdoutWrite, statusRead, statusWrite;
        if (!makePipe(stdinRead, stdinWrite) ||
            !makePipe(stdoutRead, stdoutWrite) ||
            !makePipe(statusRead, statusWrite)) {
            result.error = SidecarError{SidecarErrorKind::SpawnFailed, osError(errno)};
            return result;
        }

        // argv/envp előkészítése fork előtt: a gyerekben már nem allokálunk
        std::vector<std::string> environment = Init::sterileEnvironment();

        std::vector<char*> c_args;
        c_args.push_back(const_cast<char*>(binary.c_str()));
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        std::vector<char*> c_env;
        for (const auto& kv : environment) {
            c_env.push_back(const_cast<char*>(kv.c_str()));
        }
        c_env.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid == -1) {
            result.error = SidecarError{SidecarErrorKind::SpawnFailed, osError(errno)};
            return result;
        }

        if (pid == 0) { // Gyerek folyamat
            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, nullptr);
            ::signal(SIGPIPE, SIG_DFL);

            if (!wireStream(stdinRead.get(), STDIN_FILENO) ||
                !wireStream(stdoutWrite.get(), STDOUT_FILENO)) {
                reportAndExit(statusWrite.get(), errno);
            }

            // Tényleges futtatás shell nélkül
            ::execve(binary.c_str(), c_args.data(), c_env.data());

            // Ha az execve visszatér, hiba történt
            reportAndExit(statusWrite.get(), errno);
        }

        // Szülő: a gyerek oldali végek bezárása
        stdinRead.reset();
        stdoutWrite.reset();
        statusWrite.reset();

        // Sikeres execve esetén a CLOEXEC miatt EOF jön, különben a gyerek errno-ja
        int childErrno = 0;
        ssize_t n;
        do {
            n = ::read(statusRead.get(), &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            int err = errno;
            killAndReap(pid);
            result.error = SidecarError{SidecarErrorKind::SpawnFailed, osError(err)};
            return result;
        }
        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            int status = 0;
            waitBlocking(pid, status);
            result.error = SidecarError{SidecarErrorKind::SpawnFailed, osError(childErrno)};
            return result;
        }
        statusRead.reset();

        if (!setNonBlocking(stdinWrite.get()) || !setNonBlocking(stdoutRead.get())) {
            int err = errno;
            killAndReap(pid);
            result.error = SidecarError{SidecarErrorKind::SpawnFailed, osError(err)};
            return result;
        }

        Deadline deadline(options.timeout);
        std::optional<SidecarError> failure;
        std::size_t written = 0;
        std::vector<char> buf(AxiomTemplates::PIPE_READ_CHUNK);

        // Üres payload: azonnali EOF a gyereknek
        if (payload.empty()) {
            stdinWrite.reset();
        }

        {
            SigpipeGuard sigpipeGuard;

            // stdin írása és stdout ürítése egyszerre, hogy egy bőbeszédű gyerek se akadjon el
            while (stdinWrite.valid() || stdoutRead.valid()) {
                pollfd fds[3];
                nfds_t count = 0;
                int outIdx = -1, inIdx = -1, cancelIdx = -1;

                if (stdoutRead.valid()) {
                    outIdx = static_cast<int>(count);
                    fds[count++] = pollfd{stdoutRead.get(), POLLIN, 0};
                }
                if (stdinWrite.valid()) {
                    inIdx = static_cast<int>(count);
                    fds[count++] = pollfd{stdinWrite.get(), POLLOUT, 0};
                }
                if (cancel) {
                    cancelIdx = static_cast<int>(count);
                    fds[count++] = pollfd{cancel->pollFd(), POLLIN, 0};
                }

                int rc = ::poll(fds, count, deadline.remainingMillis());
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    failure = SidecarError{SidecarErrorKind::WaitFailed, osError(errno)};
                    break;
                }
                if (rc == 0) {
                    failure = SidecarError{SidecarErrorKind::TimedOut, deadline.describe()};
                    break;
                }

                if (cancelIdx >= 0 && (fds[cancelIdx].revents & POLLIN)) {
                    failure = SidecarError{SidecarErrorKind::Cancelled, "cancelled during exchange"};
                    break;
                }

                if (inIdx >= 0 && fds[inIdx].revents != 0) {
                    ssize_t w = ::write(stdinWrite.get(), payload.data() + written, payload.size() - written);
                    if (w < 0) {
                        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                            failure = SidecarError{SidecarErrorKind::WriteFailed, osError(errno)};
                            break;
                        }
                    } else {
                        written += static_cast<std::size_t>(w);
                        if (written == payload.size()) {
                            // EOF jelzés a gyereknek
                            stdinWrite.reset();
                        }
                    }
                }

                if (outIdx >= 0 && fds[outIdx].revents != 0) {
                    ssize_t r = ::read(stdoutRead.get(), buf.data(), buf.size());
                    if (r > 0) {
                        result.output.append(buf.data(), static_cast<std::size_t>(r));
                    } else if (r == 0) {
                        stdoutRead.reset();
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        failure = SidecarError{SidecarErrorKind::WaitFailed, osError(errno)};
                        break;
                    }
                }
            }
        }

        if (failure) {
            killAndReap(pid);
            result.error = std::move(failure);
            return result;
        }

        int status = 0;
        if (auto waitError = waitForExit(pid, deadline, cancel, status)) {
            if (waitError->kind != SidecarErrorKind::WaitFailed) {
                killAndReap(pid);
            }
            result.error = std::move(waitError);
            return result;
        }

        result.exitCode = decodeExitStatus(status);
        return result;
    }
}
