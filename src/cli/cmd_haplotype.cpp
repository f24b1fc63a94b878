// postoga haplotype: consensus classification across haplotype assemblies.

#include "subcommand.hpp"
#include "args.hpp"
#include "postoga/errors.hpp"
#include "postoga/logger.hpp"
#include "postoga/pipeline.hpp"
#include <iostream>
#include <stdexcept>

namespace postoga {
namespace cli {

int cmd_haplotype(int argc, char* argv[]) {
    HaplotypeOptions opts;
    try {
        opts = parse_haplotype_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            if (e.exit_code() != 0) {
                std::cerr << "Run 'postoga haplotype --help' for usage information.\n";
            }
        }
        return e.exit_code();
    }

    Logger log(parse_log_level(opts.level));

    try {
        HaplotypeRunConfig config;
        config.paths = opts.paths;
        config.rule = opts.rule;
        config.source = parse_consensus_source(opts.source);
        config.target = parse_annotation_target(opts.target);
        config.outdir = opts.outdir;

        std::cout << run_haplotype(config, log) << "\n";
    } catch (const Error& e) {
        log.error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log.error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

}  // namespace cli
}  // namespace postoga

namespace {
    struct HaplotypeRegistrar {
        HaplotypeRegistrar() {
            postoga::cli::SubcommandRegistry::instance().register_command(
                "haplotype",
                "Consensus classification across haplotype assemblies",
                postoga::cli::cmd_haplotype, 20);
        }
    };
    static HaplotypeRegistrar registrar;
}
