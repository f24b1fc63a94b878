#pragma once

#include "postoga/table.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace postoga {

// Query gene assigned when no source supplies one.
constexpr const char* NO_QUERY_GENE = "NO_QUERY_GENE";

// One predicted correspondence between a reference transcript and a
// query locus; the unit of the unified table.
struct Projection {
    std::optional<std::string> reference_gene;
    std::optional<std::string> reference_transcript;
    std::string query_gene = NO_QUERY_GENE;
    std::optional<std::string> query_transcript;
    std::optional<std::string> orthology_class;
    std::optional<std::string> loss_status;
    double orthology_score = 0.0;
    uint32_t fragment_count = 0;
};

using ProjectionTable = std::vector<Projection>;

// Unified table column order, as written to toga.table.gz.
extern const std::vector<std::string> PROJECTION_COLUMNS;

// Real-valued score; absent, malformed or non-finite text gives 0.
// `ok` (when given) is set to false for present-but-malformed text.
double parse_score(const Cell& text, bool* ok = nullptr);

Table projections_to_table(const ProjectionTable& projections);

// Writes the unified table (tab-separated, header, gzip when the path
// ends in ".gz"). Throws OutputError.
void write_projection_table(const ProjectionTable& projections, const std::string& path);

}  // namespace postoga
