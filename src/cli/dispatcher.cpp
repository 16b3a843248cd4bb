// growthfit <command> [options]
//
//   smooth      LOESS smoothing + log phases, JSON payload
//   band        replicate uncertainty bands, TSV
//   log-phase   detected log phases with growth rates, TSV

#include "subcommand.hpp"
#include "growthfit/version.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    const auto& registry = growthfit::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        registry.print_help(argv[0]);
        return 0;
    }
    if (first == "-V" || first == "--version") {
        std::cout << "growthfit " << GROWTHFIT_VERSION << "\n";
        return 0;
    }

    // "help smooth" is "smooth --help".
    if (first == "help") {
        if (argc < 3) {
            registry.print_help(argv[0]);
            return 0;
        }
        const auto* fn = registry.find(argv[2]);
        if (!fn) {
            std::cerr << "Unknown command: " << argv[2] << "\n";
            return 1;
        }
        char help_flag[] = "--help";
        char* sub_argv[] = {argv[2], help_flag, nullptr};
        return (*fn)(2, sub_argv);
    }

    const auto* fn = registry.find(first);
    if (!fn) {
        std::cerr << "Unknown command: " << first << "\n";
        std::cerr << "Run 'growthfit --help' for usage information.\n";
        return 1;
    }
    return (*fn)(argc - 1, argv + 1);
}
