#include "postoga/pipeline.hpp"

#include "postoga/errors.hpp"
#include "postoga/fragment_resolver.hpp"
#include "postoga/isoforms.hpp"
#include "postoga/reconciler.hpp"
#include "postoga/schema.hpp"
#include "postoga/text_io.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <map>
#include <random>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace postoga {

namespace {

std::string join_path(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

std::string require_input(const std::string& dir, const char* name) {
    const std::string path = resolve_input(join_path(dir, name));
    if (!file_exists(path)) throw MissingInputError(path);
    return path;
}

void make_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw OutputError("cannot create directory " + path + ": " + ec.message());
}

// "query_annotation.with_utrs.bed.gz" -> "query_annotation.with_utrs"
std::string model_stem(const std::string& annotation) {
    std::string name = fs::path(annotation).filename().string();
    if (has_gz_suffix(name)) name.resize(name.size() - 3);
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".bed") == 0) {
        name.resize(name.size() - 4);
    }
    return name;
}

bool is_postoga_artifact(const std::string& name) {
    static const std::unordered_set<std::string> artifacts = [] {
        std::unordered_set<std::string> s = {
            outputs::LOG, outputs::TABLE, outputs::ISOFORMS,
            outputs::FRAGMENTED_BED, outputs::FILTERED_BED,
        };
        for (const char* bed : {schema::BED_FILE, schema::BED_UTR_FILE,
                                outputs::FRAGMENTED_BED, outputs::FILTERED_BED}) {
            for (ModelFormat f : {ModelFormat::GTF, ModelFormat::GFF}) {
                s.insert(model_stem(bed) + "." + model_format_extension(f) + ".gz");
            }
        }
        return s;
    }();
    return artifacts.count(name) > 0;
}

}  // namespace

AnnotationTarget parse_annotation_target(const std::string& name) {
    if (name == "bed") return AnnotationTarget::BED;
    if (name == "utr") return AnnotationTarget::UTR;
    throw std::invalid_argument("unknown annotation target '" + name + "' (expected bed or utr)");
}

TogaInputs TogaInputs::locate(const std::string& togadir, AnnotationTarget target) {
    std::error_code ec;
    if (!fs::is_directory(togadir, ec)) {
        throw MissingInputError(togadir, "not a TOGA directory");
    }

    TogaInputs in;
    in.togadir = togadir;
    in.orthology = require_input(togadir, schema::ORTHOLOGY_FILE);
    in.loss = require_input(togadir, schema::LOSS_FILE);
    in.scores = require_input(togadir, schema::SCORES_FILE);
    in.query_genes = require_input(togadir, schema::QUERY_GENES_FILE);
    in.annotation = require_input(
        togadir, target == AnnotationTarget::UTR ? schema::BED_UTR_FILE : schema::BED_FILE);
    return in;
}

UnifiedBuild build_unified(const TogaInputs& inputs, Logger& log) {
    auto t0 = std::chrono::steady_clock::now();
    Table orthology = load_orthology_classification(inputs.orthology);
    Table loss = load_loss_summary(inputs.loss);
    Table scores = load_orthology_scores(inputs.scores);
    GeneOverrides overrides = load_gene_overrides(inputs.query_genes);
    auto t1 = std::chrono::steady_clock::now();
    log.info("Loaded " + inputs.togadir + ": " + std::to_string(orthology.num_rows()) +
             " orthology, " + std::to_string(loss.num_rows()) + " loss, " +
             std::to_string(scores.num_rows()) + " score rows (" + format_elapsed(t0, t1) + ")");

    ProjectionTable projections = Reconciler(log).reconcile(orthology, loss, scores, overrides);

    t0 = std::chrono::steady_clock::now();
    std::vector<BedRecord> coordinates = read_bed(inputs.annotation);
    t1 = std::chrono::steady_clock::now();
    log.info("Read " + std::to_string(coordinates.size()) + " coordinate rows from " +
             inputs.annotation + " (" + format_elapsed(t0, t1) + ")");

    FragmentResolution res =
        FragmentResolver(log).resolve(std::move(coordinates), std::move(projections));

    UnifiedBuild build;
    build.projections = std::move(res.projections);
    build.coordinates = std::move(res.coordinates);
    build.fragmented = res.fragmented;
    return build;
}

std::string make_run_dir_name() {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string hash;
    for (int i = 0; i < 5; ++i) hash += alphabet[pick(rng)];

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    return std::string(outputs::RUN_DIR_PREFIX) + "_" + hash + "_" + stamp;
}

size_t depure_outputs(const std::string& parent, Logger& log) {
    std::error_code ec;
    fs::directory_iterator it(parent, ec);
    if (ec) {
        log.warn("Cannot list " + parent + " for cleanup: " + ec.message());
        return 0;
    }

    const std::string prefix = std::string(outputs::RUN_DIR_PREFIX) + "_";
    size_t removed = 0;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        std::error_code rm_ec;
        if (name.compare(0, prefix.size(), prefix) == 0 && entry.is_directory(rm_ec)) {
            fs::remove_all(entry.path(), rm_ec);
        } else if (is_postoga_artifact(name) && entry.is_regular_file(rm_ec)) {
            fs::remove(entry.path(), rm_ec);
        } else {
            continue;
        }
        if (rm_ec) {
            log.warn("Cannot remove " + entry.path().string() + ": " + rm_ec.message());
        } else {
            log.debug("Removed " + entry.path().string());
            ++removed;
        }
    }
    log.info("Removed " + std::to_string(removed) + " previous postoga outputs from " + parent);
    return removed;
}

BaseRun::BaseRun(BaseRunConfig config, Logger& log, GeneModelConverter* converter)
    : config_(std::move(config)), log_(log), converter_(converter) {}

BaseRunResult BaseRun::run() {
    const auto t_start = std::chrono::steady_clock::now();

    // Every input is checked before anything is written.
    const TogaInputs inputs = TogaInputs::locate(config_.togadir, config_.target);
    if (!config_.isoforms.empty() && !file_exists(config_.isoforms)) {
        throw MissingInputError(config_.isoforms, "isoform map");
    }
    const bool converting = !config_.only_table && config_.format != ModelFormat::BED;
    if (converting && !converter_) {
        throw OutputError(std::string("no converter available for ") +
                          model_format_extension(config_.format) + " output");
    }

    const std::string parent = config_.outdir.empty() ? config_.togadir : config_.outdir;
    if (config_.depure) depure_outputs(parent, log_);

    BaseRunResult res;
    res.run_dir = join_path(parent, make_run_dir_name());
    make_directory(res.run_dir);
    log_.attach_file(join_path(res.run_dir, outputs::LOG));
    log_.info("postoga base run in " + res.run_dir);

    UnifiedBuild build = build_unified(inputs, log_);
    res.annotation = inputs.annotation;
    res.fragmented = build.fragmented;
    if (build.fragmented) {
        res.annotation = join_path(res.run_dir, outputs::FRAGMENTED_BED);
        write_bed(build.coordinates, res.annotation);
        log_.info("Fragment-suffixed coordinates written to " + res.annotation);
    }

    if (config_.filters.active()) {
        FilterResult filtered =
            FilterPipeline(log_).run(build.projections, build.coordinates, config_.filters);
        build.projections = std::move(filtered.projections);
        build.coordinates = std::move(filtered.coordinates);
        res.annotation = join_path(res.run_dir, outputs::FILTERED_BED);
        write_bed(build.coordinates, res.annotation);
        res.filtered = true;
        log_.info("Filtered coordinates written to " + res.annotation);
    }
    res.projections = build.projections.size();
    res.coordinates = build.coordinates.size();

    if (!config_.only_table) {
        if (config_.isoforms.empty()) {
            res.isoforms = write_isoforms(build, res.run_dir);
        } else {
            res.isoforms = config_.isoforms;
            if (build.fragmented) {
                log_.warn("Isoform map " + config_.isoforms +
                          " is used with fragment-suffixed coordinates; ids ending in #FG<n> "
                          "will not match its entries");
            }
        }
    }

    if (!config_.only_convert) {
        res.table = join_path(res.run_dir, outputs::TABLE);
        write_projection_table(build.projections, res.table);
        log_.info("Unified table with " + std::to_string(res.projections) +
                  " rows written to " + res.table);
    }

    if (!config_.only_table) {
        res.model = convert(res.annotation, res.isoforms, res.run_dir);
    }

    const auto t_end = std::chrono::steady_clock::now();
    log_.info("postoga base finished in " + format_elapsed(t_start, t_end));
    return res;
}

std::string BaseRun::write_isoforms(const UnifiedBuild& build, const std::string& run_dir) const {
    const IsoformMap isoforms = build_isoform_map(build.coordinates, build.projections);
    const std::string path = join_path(run_dir, outputs::ISOFORMS);
    write_isoform_map(isoforms, path);
    log_.info("Isoform map with " + std::to_string(isoforms.size()) + " rows written to " + path);
    if (isoforms.size() < build.coordinates.size()) {
        log_.warn(std::to_string(build.coordinates.size() - isoforms.size()) +
                  " coordinate rows have no unified projection and are left out of the isoform map");
    }
    return path;
}

std::string BaseRun::convert(const std::string& annotation, const std::string& isoforms,
                             const std::string& run_dir) const {
    if (config_.format == ModelFormat::BED) {
        log_.info("Gene model format is bed; " + annotation + " is the final model");
        return annotation;
    }

    const auto t0 = std::chrono::steady_clock::now();
    const std::string output = join_path(
        run_dir, model_stem(annotation) + "." + model_format_extension(config_.format) + ".gz");
    const std::string model = converter_->convert(annotation, isoforms, output);
    const auto t1 = std::chrono::steady_clock::now();
    log_.info("Gene model written to " + model + " (" + format_elapsed(t0, t1) + ")");
    return model;
}

std::string run_haplotype(const HaplotypeRunConfig& config, Logger& log) {
    if (config.paths.size() < 2) {
        throw std::invalid_argument("haplotype consensus needs at least two TOGA directories, got " +
                                    std::to_string(config.paths.size()));
    }
    const auto t_start = std::chrono::steady_clock::now();
    const TierRank rank = TierRank::parse(config.rule);

    // Validate every directory before loading any of them
    std::vector<TogaInputs> query_inputs;
    std::vector<std::string> loss_paths;
    for (const auto& path : config.paths) {
        if (config.source == ConsensusSource::QUERY) {
            query_inputs.push_back(TogaInputs::locate(path, config.target));
        } else {
            loss_paths.push_back(require_input(path, schema::LOSS_FILE));
        }
    }

    const std::string outdir = config.outdir.empty() ? config.paths.front() : config.outdir;
    make_directory(outdir);
    log.attach_file(join_path(outdir, outputs::LOG));
    log.info("postoga haplotype: " + std::to_string(config.paths.size()) + " directories, source " +
             consensus_source_name(config.source) + ", rule " + config.rule);

    std::vector<Table> tables;
    if (config.source == ConsensusSource::QUERY) {
        for (const auto& inputs : query_inputs) {
            UnifiedBuild build = build_unified(inputs, log);
            ProjectionTable kept;
            std::vector<BedRecord> kept_coordinates;
            intersect_with_coordinates(build.projections, build.coordinates, kept, kept_coordinates);
            log.info(inputs.togadir + ": " + std::to_string(kept.size()) +
                     " projections present in the coordinate file");
            tables.push_back(projections_to_consensus_input(kept));
        }
    } else {
        for (const auto& path : loss_paths) {
            Table loss = load_loss_summary(path);
            const auto levels = loss.value_counts("level");
            std::string summary;
            for (const auto& [level, n] : levels) {
                summary += " " + level + "=" + std::to_string(n);
            }
            log.info(path + ": " + std::to_string(loss.num_rows()) + " rows," + summary);
            tables.push_back(loss_to_consensus_input(loss));
        }
    }

    ConsensusMerger merger(log, config.source);
    const std::vector<HaplotypeConsensus> merged = merger.merge(tables, rank);
    const Table table = merger.to_table(merged);

    const std::string out = join_path(outdir, outputs::HAPLOTYPE);
    write_table(table, out, true);

    std::map<std::string, size_t> histogram;
    for (const auto& hc : merged) ++histogram[hc.consensus];
    for (const auto& tier : rank.tiers()) {
        auto it = histogram.find(tier);
        log.info("  consensus " + tier + ": " +
                 std::to_string(it == histogram.end() ? 0 : it->second));
    }

    const auto t_end = std::chrono::steady_clock::now();
    log.info("Consensus table with " + std::to_string(table.num_rows()) + " rows written to " +
             out + " (" + format_elapsed(t_start, t_end) + ")");
    return out;
}

}  // namespace postoga
