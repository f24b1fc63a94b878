// Main entry point for the postoga CLI with subcommand dispatch
//
// Usage:
//   postoga base --togadir <dir> [options]          Unified table + gene model
//   postoga haplotype --haplotype-paths <a,b,...>   Consensus across haplotypes

#include "subcommand.hpp"
#include "args.hpp"
#include <iostream>
#include <cstring>

int main(int argc, char* argv[]) {
    auto& registry = postoga::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(std::cout, argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(std::cout, argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        postoga::cli::print_version();
        return 0;
    }

    if (registry.has_command(first_arg)) {
        return registry.run_command(first_arg, argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'postoga --help' for usage information.\n";
    return 1;
}
