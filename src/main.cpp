#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "cli/CommandLine.hpp"
#include "core/SidecarRunner.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return Axiom::Cli::run(
        args,
        [] { return std::make_unique<Axiom::Core::SidecarRunner>(); },
        std::cin, std::cout, std::cerr,
        argc > 0 ? argv[0] : "axiom-sidecar");
}
