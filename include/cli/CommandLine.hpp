// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Axiom::Core {
    class SidecarRunner;
}

namespace Axiom::Cli {

    enum ExitCode {
        EXIT_OK = 0,
        EXIT_INVOCATION_ERROR = 1,
        EXIT_USAGE = 2,
        EXIT_INTEGRITY = 3
    };

    // Hibás parancssor: mindig EXIT_USAGE
    class UsageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct CliOptions {
        bool dryRun = false;
        bool help = false;
        std::chrono::milliseconds timeout{0};
        std::vector<std::string> words;
    };

    /**
     * @brief argv[1..] feldolgozása. `--timeout-ms` csak teljes, nem negatív egész lehet,
     * legfeljebb AxiomTemplates::MAX_TIMEOUT_MS. Minden más argumentum a bemenet egy szava.
     */
    CliOptions parseArguments(const std::vector<std::string>& args);

    void printUsage(std::ostream& err, const std::string& argv0);

    // A runner a feldolgozás után készül: a hibás beégetett digest így EXIT_USAGE lesz
    using RunnerFactory = std::function<std::unique_ptr<Core::SidecarRunner>()>;

    /**
     * @brief A teljes parancssori folyamat, a kilépési kóddal tér vissza.
     * Bemenet: a szavak szóközzel összefűzve, vagy ha nincs szó, a teljes `in`.
     */
    int run(const std::vector<std::string>& args,
            const RunnerFactory& makeRunner,
            std::istream& in,
            std::ostream& out,
            std::ostream& err,
            const std::string& argv0 = "axiom-sidecar");
}

#endif // COMMAND_LINE_HPP
