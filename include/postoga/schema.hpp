#pragma once
// Schema loader: raw TOGA output files -> canonical Tables.
//
// Each loader knows only its own file layout. Missing-value tokens
// ("", NA, N/A, NaN, nan, None, null, NULL) load as absent cells.

#include "postoga/table.hpp"

#include <string>
#include <utility>
#include <vector>

namespace postoga {

using ColumnSpec = std::vector<std::string>;

// projection -> query_gene overrides, in order of first appearance; a repeated
// projection takes its last entry.
using GeneOverrides = std::vector<std::pair<std::string, std::string>>;

namespace schema {

// TOGA output directory layout
constexpr const char* ORTHOLOGY_FILE = "orthology_classification.tsv";
constexpr const char* LOSS_FILE = "loss_summary.tsv";
constexpr const char* SCORES_FILE = "orthology_scores.tsv";
constexpr const char* QUERY_GENES_FILE = "query_genes.tsv";
constexpr const char* BED_FILE = "query_annotation.bed";
constexpr const char* BED_UTR_FILE = "query_annotation.with_utrs.bed";

// Finest loss_summary granularity (the others are TRANSCRIPT and GENE)
constexpr const char* PROJECTION_LEVEL = "PROJECTION";

extern const ColumnSpec ORTHOLOGY_COLUMNS;  // reference_gene .. orthology_class
extern const ColumnSpec LOSS_COLUMNS;       // level, query_transcript, loss_status
extern const ColumnSpec SCORE_COLUMNS;      // transcript, chain, orthology_score

bool is_null_token(const std::string& value);

}  // namespace schema

// Reads a tab-separated file and names its columns from `spec`, skipping
// the first line when `skip_header` is set. Blank lines are ignored.
// Throws MissingInputError / SchemaMismatchError.
Table load_table(const std::string& path, const ColumnSpec& spec, bool skip_header);

// Reads a tab-separated file whose first line is a header and keeps only
// `required` columns (in that order). Throws SchemaMismatchError when a
// required column is missing or a row is wider/narrower than the header.
Table load_table_by_header(const std::string& path, const ColumnSpec& required);

Table load_orthology_classification(const std::string& path);
Table load_loss_summary(const std::string& path);
Table load_orthology_scores(const std::string& path);
GeneOverrides load_gene_overrides(const std::string& path);

}  // namespace postoga
