#include "postoga/reconciler.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <unordered_map>
#include <unordered_set>

namespace postoga {

namespace {

constexpr const char* LOSS_LOCUS = "loss_locus";

}  // namespace

std::string loss_locus_key(const std::string& projection_id) {
    size_t pos = projection_id.rfind('#');
    if (pos == std::string::npos) pos = projection_id.rfind('.');
    if (pos == std::string::npos) return projection_id;
    return projection_id.substr(0, pos);
}

std::string fragment_marker(const std::string& query_transcript) {
    const size_t pos = query_transcript.rfind('$');
    if (pos == std::string::npos) return {};
    return query_transcript.substr(pos + 1);
}

bool is_retro_projection(const std::string& query_transcript) {
    const size_t pos = query_transcript.rfind('#');
    if (pos == std::string::npos) return false;
    std::string tail = query_transcript.substr(pos + 1);
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == "retro";
}

ProjectionTable Reconciler::reconcile(const Table& orthology,
                                      const Table& loss,
                                      const Table& scores,
                                      const GeneOverrides& overrides) const {
    const auto t_start = std::chrono::steady_clock::now();
    log_.info("Reconciling " + std::to_string(orthology.num_rows()) +
              " orthology rows, " + std::to_string(loss.num_rows()) +
              " loss rows, " + std::to_string(scores.num_rows()) +
              " score rows and " + std::to_string(overrides.size()) +
              " query gene overrides");

    JoinStats js;
    Table table = orthology.outer_join(projection_level_loss(loss), "query_transcript", &js);
    report_join(js, "orthology/loss");

    size_t filled = table.fill_null_from("reference_transcript", LOSS_LOCUS);
    log_.debug("reference_transcript filled from loss locus ids: " + std::to_string(filled));
    fill_genes(table, "after loss join");

    table = table.outer_join(keyed_scores(scores), "query_transcript", &js);
    report_join(js, "scores");

    filled = table.fill_null_from("reference_transcript", "transcript");
    log_.debug("reference_transcript filled from score transcripts: " + std::to_string(filled));
    fill_genes(table, "after score join");

    apply_overrides(table, overrides);

    ProjectionTable projections = to_projections(table);

    const auto t_end = std::chrono::steady_clock::now();
    log_.info("Unified table has " + std::to_string(projections.size()) +
              " projections (" + format_elapsed(t_start, t_end) + ")");
    return projections;
}

Table Reconciler::projection_level_loss(const Table& loss) const {
    Table filtered = loss.filter([](const Table& t, size_t r) {
        const Cell& level = t.get(r, "level");
        return level && *level == schema::PROJECTION_LEVEL;
    });
    log_.debug("Loss rows at " + std::string(schema::PROJECTION_LEVEL) + " level: " +
               std::to_string(filtered.num_rows()) + " of " +
               std::to_string(loss.num_rows()));

    Table keyed = filtered.select({"query_transcript", "loss_status"});
    keyed.add_column(LOSS_LOCUS);
    const size_t q = keyed.column_index("query_transcript");
    const size_t k = keyed.column_index(LOSS_LOCUS);
    for (size_t r = 0; r < keyed.num_rows(); ++r) {
        const Cell& id = keyed.at(r, q);
        if (id) keyed.at(r, k) = loss_locus_key(*id);
    }
    return keyed;
}

Table Reconciler::keyed_scores(const Table& scores) const {
    Table keyed = scores.select({"transcript", "orthology_score"});
    keyed.add_column("query_transcript");

    const size_t transcript = scores.column_index("transcript");
    const size_t chain = scores.column_index("chain");
    const size_t q = keyed.column_index("query_transcript");
    size_t unkeyed = 0;
    for (size_t r = 0; r < scores.num_rows(); ++r) {
        const Cell& t = scores.at(r, transcript);
        const Cell& c = scores.at(r, chain);
        if (t && c) {
            keyed.at(r, q) = *t + "#" + *c;
        } else {
            ++unkeyed;
        }
    }
    if (unkeyed > 0) {
        log_.warn("AmbiguousJoinWarning: " + std::to_string(unkeyed) +
                  " score rows lack transcript or chain and cannot be joined");
    }
    return keyed.select({"query_transcript", "orthology_score", "transcript"});
}

void Reconciler::fill_genes(Table& table, const char* stage) const {
    const Lookup genes = table.build_lookup("reference_transcript", "reference_gene");
    const size_t ref_before = table.count_null("reference_gene");
    const size_t query_before = table.count_null("query_gene");
    const size_t ref_filled = table.fill_null_from_lookup("reference_gene", "reference_transcript", genes);
    const size_t query_filled = table.fill_null_from_lookup("query_gene", "reference_transcript", genes);
    log_.debug(std::string("Gene fill ") + stage + ": " + std::to_string(genes.size()) +
               " transcript->gene pairs; reference_gene " + std::to_string(ref_filled) +
               "/" + std::to_string(ref_before) + " filled, query_gene " +
               std::to_string(query_filled) + "/" + std::to_string(query_before) + " filled");
}

void Reconciler::report_join(const JoinStats& stats, const char* what) const {
    log_.debug(std::string("Join ") + what + ": " + std::to_string(stats.left_rows) +
               " x " + std::to_string(stats.right_rows) + " rows, " +
               std::to_string(stats.matched) + " matched, " +
               std::to_string(stats.left_only) + " left only, " +
               std::to_string(stats.right_only) + " right only");
    if (stats.ambiguous() > 0) {
        log_.warn(std::string("AmbiguousJoinWarning: ") + what + " join saw " +
                  std::to_string(stats.left_duplicates) + " repeated left keys and " +
                  std::to_string(stats.right_duplicates) +
                  " repeated right keys; first occurrence kept");
    }
}

void Reconciler::apply_overrides(Table& table, const GeneOverrides& overrides) const {
    std::unordered_map<std::string, const std::string*> by_projection;
    by_projection.reserve(overrides.size());
    for (const auto& [projection, gene] : overrides) {
        by_projection.emplace(projection, &gene);
    }

    const size_t q = table.column_index("query_transcript");
    const size_t g = table.column_index("query_gene");
    std::unordered_set<std::string> applied;
    size_t replaced = 0;
    for (size_t r = 0; r < table.num_rows(); ++r) {
        const Cell& id = table.at(r, q);
        if (!id) continue;
        auto it = by_projection.find(*id);
        if (it == by_projection.end()) continue;
        table.at(r, g) = *it->second;
        applied.insert(*id);
        ++replaced;
    }

    size_t added = 0;
    for (const auto& [projection, gene] : overrides) {
        if (applied.count(projection)) continue;
        Row row(table.num_columns());
        row[q] = projection;
        row[g] = gene;
        table.append_row(std::move(row));
        ++added;
    }

    log_.debug("Query gene overrides: " + std::to_string(replaced) + " replaced, " +
               std::to_string(added) + " override-only projections added");
}

ProjectionTable Reconciler::to_projections(const Table& table) const {
    const size_t ref_gene = table.column_index("reference_gene");
    const size_t ref_tx = table.column_index("reference_transcript");
    const size_t q_gene = table.column_index("query_gene");
    const size_t q_tx = table.column_index("query_transcript");
    const size_t klass = table.column_index("orthology_class");
    const size_t status = table.column_index("loss_status");
    const size_t score = table.column_index("orthology_score");

    ProjectionTable out;
    out.reserve(table.num_rows());
    size_t bad_scores = 0;
    size_t fragments = 0;
    size_t retro = 0;
    size_t placeholders = 0;

    for (size_t r = 0; r < table.num_rows(); ++r) {
        Projection p;
        p.reference_gene = table.at(r, ref_gene);
        p.reference_transcript = table.at(r, ref_tx);
        p.query_transcript = table.at(r, q_tx);
        p.orthology_class = table.at(r, klass);
        p.loss_status = table.at(r, status);

        bool ok = true;
        p.orthology_score = parse_score(table.at(r, score), &ok);
        if (!ok) ++bad_scores;

        Cell gene = table.at(r, q_gene);
        if (gene && p.query_transcript) {
            const std::string marker = fragment_marker(*p.query_transcript);
            if (!marker.empty()) {
                *gene += "_" + marker;
                ++fragments;
            }
            if (is_retro_projection(*p.query_transcript)) {
                *gene += "#RETRO";
                ++retro;
            }
        }
        if (gene) {
            p.query_gene = std::move(*gene);
        } else {
            p.query_gene = NO_QUERY_GENE;
            ++placeholders;
        }
        out.push_back(std::move(p));
    }

    if (bad_scores > 0) {
        log_.warn(std::to_string(bad_scores) + " malformed orthology scores set to 0");
    }
    log_.debug("Fragment-marked query genes: " + std::to_string(fragments) +
               ", retro-marked: " + std::to_string(retro) +
               ", placeholder query genes: " + std::to_string(placeholders));
    return out;
}

}  // namespace postoga
