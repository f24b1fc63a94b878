#include "postoga/filter_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <unordered_set>

namespace postoga {

namespace {

bool contains(const std::vector<std::string>& allowed, const std::optional<std::string>& value) {
    if (!value) return false;
    return std::find(allowed.begin(), allowed.end(), *value) != allowed.end();
}

std::string join_list(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ",";
        out += v;
    }
    return out;
}

std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

template <typename Pred>
ProjectionTable keep_if(const ProjectionTable& in, Pred&& keep) {
    ProjectionTable out;
    out.reserve(in.size());
    for (const auto& p : in) {
        if (keep(p)) out.push_back(p);
    }
    return out;
}

}  // namespace

std::vector<std::string> split_list(const std::string& text, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(sep, start);
        if (end == std::string::npos) end = text.size();
        std::string item = trim(text.substr(start, end - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = end + 1;
    }
    return out;
}

bool coordinate_matches(const BedRecord& record, const std::string& query_transcript) {
    const std::string key = coordinate_key(record.name);
    return key == query_transcript || coordinate_helper(key) == query_transcript;
}

void intersect_with_coordinates(const ProjectionTable& projections,
                                const std::vector<BedRecord>& coordinates,
                                ProjectionTable& kept_projections,
                                std::vector<BedRecord>& kept_coordinates) {
    std::unordered_set<std::string> transcripts;
    transcripts.reserve(projections.size());
    for (const auto& p : projections) {
        if (p.query_transcript) transcripts.insert(*p.query_transcript);
    }

    // A coordinate row survives when its key, or the key's helper, names a
    // projection; the projections named this way are the ones that survive.
    std::unordered_set<std::string> matched;
    kept_coordinates.clear();
    for (const auto& rec : coordinates) {
        const std::string key = coordinate_key(rec.name);
        bool keep = false;
        if (transcripts.count(key)) {
            matched.insert(key);
            keep = true;
        }
        const std::string helper = coordinate_helper(key);
        if (helper != key && transcripts.count(helper)) {
            matched.insert(helper);
            keep = true;
        }
        if (keep) kept_coordinates.push_back(rec);
    }

    kept_projections.clear();
    for (const auto& p : projections) {
        if (p.query_transcript && matched.count(*p.query_transcript)) {
            kept_projections.push_back(p);
        }
    }
}

ProjectionTable FilterPipeline::apply_predicates(const ProjectionTable& projections,
                                                 const FilterParams& params,
                                                 FilterStats& stats) const {
    ProjectionTable current = projections;
    stats.initial_rows = projections.size();

    if (params.min_score) {
        const double min_score = *params.min_score;
        const size_t before = current.size();
        current = keep_if(current, [min_score](const Projection& p) {
            return p.orthology_score >= min_score;
        });
        stats.discarded_by_score = before - current.size();
        report_step(before, current.size(), "orthology_score >= " + std::to_string(min_score));
    }

    if (!params.orthology_classes.empty()) {
        const size_t before = current.size();
        current = keep_if(current, [&params](const Projection& p) {
            return contains(params.orthology_classes, p.orthology_class);
        });
        stats.discarded_by_class = before - current.size();
        report_step(before, current.size(),
                    "orthology_class in {" + join_list(params.orthology_classes) + "}");
    }

    if (!params.loss_statuses.empty()) {
        const size_t before = current.size();
        current = keep_if(current, [&params](const Projection& p) {
            return contains(params.loss_statuses, p.loss_status);
        });
        stats.discarded_by_status = before - current.size();
        report_step(before, current.size(),
                    "loss_status in {" + join_list(params.loss_statuses) + "}");
    }

    if (params.paralog_score) {
        const double threshold = *params.paralog_score;
        std::unordered_map<std::string, size_t> hits;
        for (const auto& p : current) {
            if (p.reference_transcript && p.orthology_score > threshold) {
                ++hits[*p.reference_transcript];
            }
        }
        const size_t before = current.size();
        // A projection without a reference transcript belongs to no group.
        current = keep_if(current, [&hits](const Projection& p) {
            if (!p.reference_transcript) return false;
            auto it = hits.find(*p.reference_transcript);
            return it == hits.end() || it->second <= 1;
        });
        stats.discarded_by_paralog = before - current.size();
        report_step(before, current.size(),
                    "at most one projection per reference transcript scoring above " +
                        std::to_string(threshold));
    }

    return current;
}

FilterResult FilterPipeline::run(const ProjectionTable& projections,
                                 const std::vector<BedRecord>& coordinates,
                                 const FilterParams& params) const {
    const auto t_start = std::chrono::steady_clock::now();
    FilterResult res;

    ProjectionTable passed = apply_predicates(projections, params, res.stats);
    intersect_with_coordinates(passed, coordinates, res.projections, res.coordinates);
    report_step(passed.size(), res.projections.size(), "present in the coordinate file");

    FilterStats& st = res.stats;
    st.kept_coordinates = res.coordinates.size();
    st.kept_projections = res.projections.size();

    std::unordered_set<std::string> transcripts;
    std::unordered_set<std::string> genes;
    for (const auto& p : res.projections) {
        if (p.reference_transcript) transcripts.insert(*p.reference_transcript);
        if (p.reference_gene) genes.insert(*p.reference_gene);
        ++st.class_counts[p.orthology_class.value_or("NA")];
        ++st.status_counts[p.loss_status.value_or("NA")];
    }
    st.unique_transcripts = transcripts.size();
    st.unique_genes = genes.size();

    const auto t_end = std::chrono::steady_clock::now();
    log_.info("Filtered " + std::to_string(st.initial_rows) + " -> " +
              std::to_string(st.kept_projections) + " projections, " +
              std::to_string(coordinates.size()) + " -> " +
              std::to_string(st.kept_coordinates) + " coordinate rows (" +
              format_elapsed(t_start, t_end) + ")");
    log_.info("Kept " + std::to_string(st.unique_transcripts) + " reference transcripts from " +
              std::to_string(st.unique_genes) + " reference genes");
    for (const auto& [cls, n] : st.class_counts) {
        log_.info("  orthology_class " + cls + ": " + std::to_string(n));
    }
    for (const auto& [status, n] : st.status_counts) {
        log_.info("  loss_status " + status + ": " + std::to_string(n));
    }
    return res;
}

void FilterPipeline::report_step(size_t before, size_t after, const std::string& what) const {
    log_.debug("Filter " + what + ": " + std::to_string(before) + " -> " +
               std::to_string(after) + " rows (" + std::to_string(before - after) +
               " discarded)");
    if (before > 0 && after == 0) {
        log_.warn("EmptyResultWarning: filter " + what + " discarded all " +
                  std::to_string(before) + " rows");
    }
}

}  // namespace postoga
