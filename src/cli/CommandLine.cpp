// © 2026 Beatrix Zselezny. All rights reserved.
// Axiom Sidecar Gate

#include "cli/CommandLine.hpp"
#include "core/Scheduler.hpp"
#include "core/SidecarRunner.hpp"
#include "utils/AxiomInitializer.hpp"
#include "utils/ConfigTemplates.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <iterator>

namespace Axiom::Cli {

    namespace {
        std::chrono::milliseconds parseTimeout(const std::string& text) {
            long long ms = 0;
            std::size_t consumed = 0;
            try {
                ms = std::stoll(text, &consumed);
            } catch (const std::exception&) {
                throw UsageError("Invalid --timeout-ms value: " + text);
            }
            if (consumed != text.size() || ms < 0) {
                throw UsageError("Invalid --timeout-ms value: " + text);
            }
            if (ms > AxiomTemplates::MAX_TIMEOUT_MS) {
                throw UsageError("--timeout-ms exceeds " + std::to_string(AxiomTemplates::MAX_TIMEOUT_MS) + " ms");
            }
            return std::chrono::milliseconds(ms);
        }

        std::string joinWords(const std::vector<std::string>& words) {
            std::string input;
            for (std::size_t i = 0; i < words.size(); ++i) {
                if (i) input += ' ';
                input += words[i];
            }
            return input;
        }
    }

    CliOptions parseArguments(const std::vector<std::string>& args) {
        CliOptions options;
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--dry-run") {
                options.dryRun = true;
            } else if (arg == "--timeout-ms") {
                if (i + 1 >= args.size()) {
                    throw UsageError("--timeout-ms requires a value");
                }
                options.timeout = parseTimeout(args[++i]);
            } else if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else {
                options.words.push_back(arg);
            }
        }
        return options;
    }

    void printUsage(std::ostream& err, const std::string& argv0) {
        err << "Usage: " << argv0 << " [--dry-run] [--timeout-ms N] [input...]\n"
            << "  Runs the verified sidecar with the given input (or stdin if none).\n"
            << "  --dry-run       verify the sidecar digest only, spawn nothing\n"
            << "  --timeout-ms N  kill the sidecar after N milliseconds (0 = no limit)\n";
    }

    int run(const std::vector<std::string>& args,
            const RunnerFactory& makeRunner,
            std::istream& in,
            std::ostream& out,
            std::ostream& err,
            const std::string& argv0) {
        CliOptions options;
        try {
            options = parseArguments(args);
        } catch (const UsageError& e) {
            err << "[ERROR] " << e.what() << std::endl;
            printUsage(err, argv0);
            return EXIT_USAGE;
        }

        if (options.help) {
            printUsage(err, argv0);
            return EXIT_OK;
        }

        if (Init::isRoot()) {
            err << "[WARN] Running as root: the sidecar inherits full privileges." << std::endl;
        }

        try {
            auto runner = makeRunner();

            if (options.dryRun) {
                err << "\n[!] DRY-RUN MODE - VERIFYING ONLY, NOTHING WILL BE SPAWNED [!]\n" << std::endl;
                auto outcome = runner->integrityVerifier().inspect(runner->sidecarPath());
                out << runner->sidecarPath().string() << ": " << Core::toString(outcome) << std::endl;
                return outcome == Core::VerificationOutcome::Verified ? EXIT_OK : EXIT_INTEGRITY;
            }

            std::string input = options.words.empty()
                                    ? std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>())
                                    : joinWords(options.words);

            Core::InvocationScheduler scheduler(*runner);
            auto result = scheduler.invoke(std::move(input), options.timeout);

            if (!result.ok()) {
                err << result.error().message() << std::endl;
                return result.error().kind == Core::SidecarErrorKind::IntegrityCheckFailed
                           ? EXIT_INTEGRITY
                           : EXIT_INVOCATION_ERROR;
            }

            out << result.output();
            out.flush();
            return EXIT_OK;
        } catch (const std::invalid_argument& e) {
            // Hibás beégetett digest: konfigurációs hiba
            err << "[ERROR] Trusted digest configuration: " << e.what() << std::endl;
            return EXIT_USAGE;
        } catch (const std::exception& e) {
            err << "[ERROR] " << e.what() << std::endl;
            return EXIT_INVOCATION_ERROR;
        }
    }
}
