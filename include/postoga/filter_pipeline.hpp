#pragma once
// Sequential projection filters:
//   orthology_score >= min_score
//   orthology_class in allow-set
//   loss_status in allow-set
//   paralog rule: per reference_transcript, drop the whole group when more
//   than one projection scores above the paralog threshold
// followed by mutual narrowing of the unified table and the coordinate
// file to the projections present in both.

#include "postoga/bed.hpp"
#include "postoga/logger.hpp"
#include "postoga/projection.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace postoga {

struct FilterParams {
    std::optional<double> min_score;
    std::vector<std::string> orthology_classes;  // empty = no class filter
    std::vector<std::string> loss_statuses;      // empty = no status filter
    std::optional<double> paralog_score;

    bool active() const {
        return min_score.has_value() || !orthology_classes.empty() ||
               !loss_statuses.empty() || paralog_score.has_value();
    }
};

struct FilterStats {
    size_t initial_rows = 0;
    size_t discarded_by_score = 0;
    size_t discarded_by_class = 0;
    size_t discarded_by_status = 0;
    size_t discarded_by_paralog = 0;
    size_t kept_coordinates = 0;
    size_t kept_projections = 0;
    size_t unique_transcripts = 0;
    size_t unique_genes = 0;
    std::map<std::string, size_t> class_counts;
    std::map<std::string, size_t> status_counts;
};

struct FilterResult {
    ProjectionTable projections;
    std::vector<BedRecord> coordinates;
    FilterStats stats;
};

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string& text, char sep = ',');

// True when the coordinate row belongs to a projection with this
// query_transcript: its key (suffix-free id) or the key's part before
// '$' equals the transcript.
bool coordinate_matches(const BedRecord& record, const std::string& query_transcript);

class FilterPipeline {
public:
    explicit FilterPipeline(Logger& log) : log_(log) {}

    FilterResult run(const ProjectionTable& projections,
                     const std::vector<BedRecord>& coordinates,
                     const FilterParams& params) const;

    // Only the tabular predicates, no coordinate narrowing.
    ProjectionTable apply_predicates(const ProjectionTable& projections,
                                     const FilterParams& params,
                                     FilterStats& stats) const;

private:
    void report_step(size_t before, size_t after, const std::string& what) const;

    Logger& log_;
};

// Narrow coordinates to projections in `projections` and back; the two
// outputs reference each other exactly.
void intersect_with_coordinates(const ProjectionTable& projections,
                                const std::vector<BedRecord>& coordinates,
                                ProjectionTable& kept_projections,
                                std::vector<BedRecord>& kept_coordinates);

}  // namespace postoga
