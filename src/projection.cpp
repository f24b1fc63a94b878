#include "postoga/projection.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace postoga {

const std::vector<std::string> PROJECTION_COLUMNS = {
    "reference_gene",
    "reference_transcript",
    "query_gene",
    "query_transcript",
    "orthology_class",
    "loss_status",
    "orthology_score",
    "fragment_count",
};

double parse_score(const Cell& text, bool* ok) {
    if (ok) *ok = true;
    if (!text || text->empty()) return 0.0;

    const char* begin = text->c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        if (ok) *ok = false;
        return 0.0;
    }
    return value;
}

namespace {

std::string format_score(double score) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", score);
    return buf;
}

}  // namespace

Table projections_to_table(const ProjectionTable& projections) {
    Table table(PROJECTION_COLUMNS);
    for (const auto& p : projections) {
        table.append_row({
            p.reference_gene,
            p.reference_transcript,
            p.query_gene,
            p.query_transcript,
            p.orthology_class,
            p.loss_status,
            format_score(p.orthology_score),
            std::to_string(p.fragment_count),
        });
    }
    return table;
}

void write_projection_table(const ProjectionTable& projections, const std::string& path) {
    write_table(projections_to_table(projections), path, true);
}

}  // namespace postoga
