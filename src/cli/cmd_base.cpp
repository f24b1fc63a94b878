// postoga base: unified table, fragment resolution, filters and gene-model
// conversion for one TOGA results directory.

#include "subcommand.hpp"
#include "args.hpp"
#include "postoga/errors.hpp"
#include "postoga/logger.hpp"
#include "postoga/pipeline.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace postoga {
namespace cli {

int cmd_base(int argc, char* argv[]) {
    BaseOptions opts;
    try {
        opts = parse_base_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            if (e.exit_code() != 0) {
                std::cerr << "Run 'postoga base --help' for usage information.\n";
            }
        }
        return e.exit_code();
    }

    Logger log(parse_log_level(opts.level));

    try {
        BaseRunConfig config;
        config.togadir = opts.togadir;
        config.outdir = opts.outdir;
        config.target = parse_annotation_target(opts.target);
        config.format = parse_model_format(opts.to);
        config.isoforms = opts.isoforms;
        config.only_table = opts.only_table;
        config.only_convert = opts.only_convert;
        config.depure = opts.depure;
        config.filters.orthology_classes = opts.by_class;
        config.filters.loss_statuses = opts.by_status;
        config.filters.min_score = opts.min_score;
        config.filters.paralog_score = opts.paralog_score;

        ExternalGeneModelConverter converter(
            ExternalGeneModelConverter::default_tool(config.format), log);
        BaseRun run(std::move(config), log, &converter);
        const BaseRunResult res = run.run();

        std::cout << res.run_dir << "\n";
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
    struct BaseRegistrar {
        BaseRegistrar() {
            postoga::cli::SubcommandRegistry::instance().register_command(
                "base",
                "Unified projection table and gene model of one TOGA run",
                postoga::cli::cmd_base, 10);
        }
    };
    static BaseRegistrar registrar;
}
