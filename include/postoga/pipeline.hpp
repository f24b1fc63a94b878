#pragma once
// Run drivers for the two entry points:
//   base      one TOGA directory -> unified table, coordinate file,
//             isoform map, gene model
//   haplotype several TOGA directories -> consensus table

#include "postoga/bed.hpp"
#include "postoga/consensus.hpp"
#include "postoga/filter_pipeline.hpp"
#include "postoga/gene_model.hpp"
#include "postoga/logger.hpp"
#include "postoga/projection.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace postoga {

enum class AnnotationTarget {
    BED,  // query_annotation.bed
    UTR   // query_annotation.with_utrs.bed
};

AnnotationTarget parse_annotation_target(const std::string& name);

// Output names inside a run directory
namespace outputs {
constexpr const char* RUN_DIR_PREFIX = "POSTOGA";
constexpr const char* LOG = "postoga.log";
constexpr const char* TABLE = "toga.table.gz";
constexpr const char* ISOFORMS = "isoforms.tsv";
constexpr const char* FRAGMENTED_BED = "fragmented.bed";
constexpr const char* FILTERED_BED = "filtered.bed";
constexpr const char* HAPLOTYPE = "haplotype_consensus.tsv";
}  // namespace outputs

// Input file paths of one TOGA directory.
struct TogaInputs {
    std::string togadir;
    std::string orthology;
    std::string loss;
    std::string scores;
    std::string query_genes;
    std::string annotation;

    // Resolves every path (".gz" variants accepted). Throws
    // MissingInputError when the directory or any file is absent.
    static TogaInputs locate(const std::string& togadir, AnnotationTarget target);
};

// Reconciled and fragment-resolved state of one TOGA directory.
struct UnifiedBuild {
    ProjectionTable projections;
    std::vector<BedRecord> coordinates;
    bool fragmented = false;
};

// Schema Loader -> Reconciler -> Fragment Resolver.
UnifiedBuild build_unified(const TogaInputs& inputs, Logger& log);

struct BaseRunConfig {
    std::string togadir;
    std::string outdir;            // parent of the run directory; togadir when empty
    AnnotationTarget target = AnnotationTarget::UTR;
    FilterParams filters;
    ModelFormat format = ModelFormat::GTF;
    std::string isoforms;          // user-supplied map; computed when empty
    bool only_table = false;
    bool only_convert = false;
    bool depure = false;
};

struct BaseRunResult {
    std::string run_dir;
    std::string table;             // empty with only_convert
    std::string annotation;        // coordinate file used for conversion
    std::string isoforms;
    std::string model;             // empty with only_table
    size_t projections = 0;
    size_t coordinates = 0;
    bool fragmented = false;
    bool filtered = false;
};

// "POSTOGA_<5 chars [A-Z0-9]>_<YYYYmmdd_HHMMSS>"
std::string make_run_dir_name();

// Removes earlier postoga artifacts below `parent`; failures are warnings.
// Returns the number of entries removed.
size_t depure_outputs(const std::string& parent, Logger& log);

class BaseRun {
public:
    // `converter` may be null only for ModelFormat::BED or only_table.
    BaseRun(BaseRunConfig config, Logger& log, GeneModelConverter* converter);

    BaseRunResult run();

private:
    std::string write_isoforms(const UnifiedBuild& build, const std::string& run_dir) const;
    std::string convert(const std::string& annotation, const std::string& isoforms,
                        const std::string& run_dir) const;

    BaseRunConfig config_;
    Logger& log_;
    GeneModelConverter* converter_;
};

struct HaplotypeRunConfig {
    std::vector<std::string> paths;
    std::string rule = "I>PI>UL>L>M>PM>PG>NF";
    ConsensusSource source = ConsensusSource::LOSS;
    AnnotationTarget target = AnnotationTarget::UTR;
    std::string outdir;            // first path when empty
};

// Returns the written consensus table path.
std::string run_haplotype(const HaplotypeRunConfig& config, Logger& log);

}  // namespace postoga
