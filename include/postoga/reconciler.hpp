#pragma once
// Reconciler: joins the orthology, loss, score and gene-override tables
// into one Projection per query_transcript.
//
// Fill order (first value set wins; later steps only touch absent cells,
// except the explicit gene override):
//   1. loss rows at PROJECTION level, keyed by a locus id derived from
//      the projection id (last '#'/'.' segment dropped)
//   2. orthology <outer> loss on query_transcript; reference_transcript
//      from the loss locus id
//   3. reference_gene/query_gene via a transcript->gene lookup
//   4. <outer> scores on transcript#chain; reference_transcript from the
//      score transcript
//   5. lookup fill again
//   6. query_gene overrides (always win)
//   7. fragment ('$') and retro ('#retro') markers on query_gene
//   8. NO_QUERY_GENE placeholder

#include "postoga/logger.hpp"
#include "postoga/projection.hpp"
#include "postoga/schema.hpp"
#include "postoga/table.hpp"

#include <string>

namespace postoga {

// Locus id a loss row belongs to: the projection id minus its last
// '#'-separated segment, or minus its last '.'-separated segment when it
// has no '#'. An id with neither separator is returned unchanged.
std::string loss_locus_key(const std::string& projection_id);

// Text after the last '$', or empty when there is none.
std::string fragment_marker(const std::string& query_transcript);

// True when the last '#'-separated segment is "retro" (any case).
bool is_retro_projection(const std::string& query_transcript);

class Reconciler {
public:
    explicit Reconciler(Logger& log) : log_(log) {}

    // Inputs are the Schema Loader tables (ORTHOLOGY_COLUMNS, LOSS_COLUMNS,
    // SCORE_COLUMNS) and the override list. Performs no I/O.
    ProjectionTable reconcile(const Table& orthology,
                              const Table& loss,
                              const Table& scores,
                              const GeneOverrides& overrides) const;

private:
    Table projection_level_loss(const Table& loss) const;
    Table keyed_scores(const Table& scores) const;
    void fill_genes(Table& table, const char* stage) const;
    void report_join(const JoinStats& stats, const char* what) const;
    void apply_overrides(Table& table, const GeneOverrides& overrides) const;
    ProjectionTable to_projections(const Table& table) const;

    Logger& log_;
};

}  // namespace postoga
