#include "args.hpp"
#include "postoga/filter_pipeline.hpp"
#include "postoga/version.h"
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <iostream>
#include <string>

namespace postoga {
namespace cli {

namespace {

double parse_real(const std::string& flag, const std::string& value) {
    try {
        size_t idx = 0;
        double parsed = std::stod(value, &idx);
        if (idx != value.size() || !std::isfinite(parsed)) {
            throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const ParseArgsExit&) {
        throw;
    } catch (const std::exception&) {
        throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
    }
}

void require_one_of(const std::string& flag, const std::string& value,
                    std::initializer_list<const char*> allowed) {
    for (const char* a : allowed) {
        if (value == a) return;
    }
    std::string list;
    for (const char* a : allowed) {
        if (!list.empty()) list += ", ";
        list += a;
    }
    throw ParseArgsExit(1, "Error: Invalid value for " + flag + ": '" + value +
                               "' (expected one of " + list + ")");
}

}  // namespace

std::string version_banner() {
    return std::string("postoga v") + POSTOGA_VERSION;
}

void print_version() {
    std::cout << "postoga " << POSTOGA_VERSION << "\n";
}

void print_base_usage(const char* program_name) {
    std::cout << version_banner() << "\n\n";
    std::cout << "Usage: " << program_name << " --togadir <dir> [options]\n\n";
    std::cout << "Builds the unified projection table of one TOGA run and converts the\n";
    std::cout << "query annotation into a gene model.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -td, --togadir <dir>              TOGA results directory (required)\n";
    std::cout << "  -o,  --outdir <dir>               Parent of the run directory (default: togadir)\n";
    std::cout << "  -bc, --by-orthology-class <list>  Keep these orthology classes (comma list)\n";
    std::cout << "  -bl, --by-loss-status <list>      Keep these loss statuses (comma list)\n";
    std::cout << "  -bs, --by-orthology-score <x>     Keep projections scoring >= x\n";
    std::cout << "  -bp, --by-paralog-score <x>       Drop reference transcripts with more than\n";
    std::cout << "                                    one projection scoring above x\n";
    std::cout << "  -to, --to <fmt>                   Gene model format: gtf, gff, bed (default: gtf)\n";
    std::cout << "  -tg, --target <which>             Annotation: bed or utr (default: utr)\n";
    std::cout << "  -w,  --with-isoforms <file>       Use this gene/transcript map\n";
    std::cout << "  -ot, --only-table                 Write the unified table and stop\n";
    std::cout << "  -oc, --only-convert               Only convert the annotation\n";
    std::cout << "  -d,  --depure                     Remove earlier postoga outputs first\n";
    std::cout << "  -L,  --level <level>              Log level: debug, info, warn, error, off\n";
    std::cout << "  -V,  --version                    Show version and exit\n";
    std::cout << "  -h,  --help                       Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -td toga_out --to gff -bc one2one,one2many -bs 0.5\n";
    std::cout << "  " << program_name << " -td toga_out --only-table -L debug\n";
}

void print_haplotype_usage(const char* program_name) {
    std::cout << version_banner() << "\n\n";
    std::cout << "Usage: " << program_name << " --haplotype-paths <dir1,dir2,...> [options]\n\n";
    std::cout << "Merges the classifications of several haplotype assemblies into one\n";
    std::cout << "consensus class per transcript.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -hp, --haplotype-paths <list>  TOGA directories, at least two (required)\n";
    std::cout << "  -r,  --rule <rule>             Tier order, best first\n";
    std::cout << "                                 (default: I>PI>UL>L>M>PM>PG>NF)\n";
    std::cout << "  -s,  --source <src>            query or loss (default: loss)\n";
    std::cout << "  -o,  --outdir <dir>            Output directory (default: first path)\n";
    std::cout << "  -tg, --target <which>          Annotation for --source query: bed or utr\n";
    std::cout << "  -L,  --level <level>           Log level: debug, info, warn, error, off\n";
    std::cout << "  -V,  --version                 Show version and exit\n";
    std::cout << "  -h,  --help                    Show this help message\n";
}

BaseOptions parse_base_args(int argc, char* argv[]) {
    BaseOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_base_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-td" || arg == "--togadir") {
            opts.togadir = require_value(arg);
        } else if (arg == "-o" || arg == "--outdir") {
            opts.outdir = require_value(arg);
        } else if (arg == "-bc" || arg == "--by-orthology-class") {
            opts.by_class = split_list(require_value(arg));
        } else if (arg == "-bl" || arg == "--by-loss-status") {
            opts.by_status = split_list(require_value(arg));
        } else if (arg == "-bs" || arg == "--by-orthology-score") {
            opts.min_score = parse_real(arg, require_value(arg));
        } else if (arg == "-bp" || arg == "--by-paralog-score") {
            opts.paralog_score = parse_real(arg, require_value(arg));
        } else if (arg == "-to" || arg == "--to") {
            opts.to = require_value(arg);
            require_one_of(arg, opts.to, {"gtf", "gff", "gff3", "bed"});
        } else if (arg == "-tg" || arg == "--target") {
            opts.target = require_value(arg);
            require_one_of(arg, opts.target, {"bed", "utr"});
        } else if (arg == "-w" || arg == "--with-isoforms") {
            opts.isoforms = require_value(arg);
        } else if (arg == "-ot" || arg == "--only-table") {
            opts.only_table = true;
        } else if (arg == "-oc" || arg == "--only-convert") {
            opts.only_convert = true;
        } else if (arg == "-d" || arg == "--depure") {
            opts.depure = true;
        } else if (arg == "-L" || arg == "--level") {
            opts.level = require_value(arg);
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.togadir.empty()) {
        throw ParseArgsExit(1, "Error: --togadir is required");
    }
    if (opts.only_table && opts.only_convert) {
        throw ParseArgsExit(1, "Error: --only-table and --only-convert are mutually exclusive");
    }
    if (opts.min_score && (*opts.min_score < 0.0 || *opts.min_score > 1.0)) {
        throw ParseArgsExit(1, "Error: --by-orthology-score must be within [0, 1]");
    }
    if (opts.paralog_score && (*opts.paralog_score < 0.0 || *opts.paralog_score > 1.0)) {
        throw ParseArgsExit(1, "Error: --by-paralog-score must be within [0, 1]");
    }

    return opts;
}

HaplotypeOptions parse_haplotype_args(int argc, char* argv[]) {
    HaplotypeOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_haplotype_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-hp" || arg == "--haplotype-paths") {
            opts.paths = split_list(require_value(arg));
        } else if (arg == "-r" || arg == "--rule") {
            opts.rule = require_value(arg);
        } else if (arg == "-s" || arg == "--source") {
            opts.source = require_value(arg);
            require_one_of(arg, opts.source, {"query", "loss"});
        } else if (arg == "-o" || arg == "--outdir") {
            opts.outdir = require_value(arg);
        } else if (arg == "-tg" || arg == "--target") {
            opts.target = require_value(arg);
            require_one_of(arg, opts.target, {"bed", "utr"});
        } else if (arg == "-L" || arg == "--level") {
            opts.level = require_value(arg);
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.paths.size() < 2) {
        throw ParseArgsExit(1, "Error: --haplotype-paths needs at least two directories");
    }

    return opts;
}

}  // namespace cli
}  // namespace postoga
