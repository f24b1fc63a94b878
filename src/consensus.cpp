#include "postoga/consensus.hpp"

#include "postoga/errors.hpp"

#include <chrono>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace postoga {

namespace {

// Older rule strings spell the not-found tier "abs".
constexpr const char* LEGACY_NOT_FOUND = "abs";

std::string trim(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}  // namespace

TierRank TierRank::parse(const std::string& rule) {
    std::vector<std::string> tiers;
    std::unordered_set<std::string> seen;
    size_t start = 0;
    while (true) {
        const size_t end = rule.find('>', start);
        const std::string tier =
            trim(rule.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (tier.empty()) {
            throw RuleError("empty tier in consensus rule '" + rule + "'");
        }
        if (!seen.insert(tier).second) {
            throw RuleError("tier '" + tier + "' appears twice in consensus rule '" + rule + "'");
        }
        if (tier != NOT_FOUND_CLASS && tier != LEGACY_NOT_FOUND) tiers.push_back(tier);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return TierRank(tiers);
}

TierRank::TierRank(const std::vector<std::string>& tiers) {
    for (const auto& t : tiers) {
        if (t == NOT_FOUND_CLASS) continue;
        if (ranks_.emplace(t, tiers_.size()).second) tiers_.push_back(t);
    }
    ranks_.emplace(NOT_FOUND_CLASS, tiers_.size());
    tiers_.push_back(NOT_FOUND_CLASS);
}

std::optional<size_t> TierRank::rank(const std::string& tier) const {
    auto it = ranks_.find(tier);
    if (it == ranks_.end()) return std::nullopt;
    return it->second;
}

ConsensusSource parse_consensus_source(const std::string& name) {
    if (name == "query") return ConsensusSource::QUERY;
    if (name == "loss") return ConsensusSource::LOSS;
    throw std::invalid_argument("unknown consensus source '" + name +
                                "' (expected query or loss)");
}

const char* consensus_source_name(ConsensusSource source) {
    return source == ConsensusSource::QUERY ? "query" : "loss";
}

const std::vector<std::string>& consensus_input_columns(ConsensusSource source) {
    static const std::vector<std::string> query = {
        "reference_gene", "reference_transcript", "transcript", "relation", "class"};
    static const std::vector<std::string> loss = {"projection", "transcript", "class"};
    return source == ConsensusSource::QUERY ? query : loss;
}

const std::vector<std::string>& consensus_output_columns(ConsensusSource source) {
    static const std::vector<std::string> query = {
        "reference_gene", "reference_transcript", "transcript", "relation", "consensus"};
    static const std::vector<std::string> loss = {"projection", "transcript", "consensus"};
    return source == ConsensusSource::QUERY ? query : loss;
}

Table projections_to_consensus_input(const ProjectionTable& projections) {
    Table t(consensus_input_columns(ConsensusSource::QUERY));
    for (const auto& p : projections) {
        if (!p.query_transcript) continue;
        t.append_row({p.reference_gene, p.reference_transcript, p.query_transcript,
                      p.orthology_class, p.loss_status});
    }
    return t;
}

Table loss_to_consensus_input(const Table& loss) {
    Table t = loss.select({"level", "query_transcript", "loss_status"});
    t.rename_column("level", "projection");
    t.rename_column("query_transcript", "transcript");
    t.rename_column("loss_status", "class");
    return t;
}

std::vector<HaplotypeConsensus> ConsensusMerger::merge(const std::vector<Table>& tables,
                                                       const TierRank& rank) const {
    if (tables.size() < 2) {
        throw std::invalid_argument("haplotype consensus needs at least two tables, got " +
                                    std::to_string(tables.size()));
    }
    const auto& columns = consensus_input_columns(source_);
    for (size_t i = 0; i < tables.size(); ++i) {
        for (const auto& c : columns) {
            if (!tables[i].has_column(c)) {
                throw std::invalid_argument("haplotype table " + std::to_string(i + 1) +
                                            " lacks column '" + c + "'");
            }
        }
    }

    const auto t_start = std::chrono::steady_clock::now();
    const size_t n_sources = tables.size();
    const bool query = source_ == ConsensusSource::QUERY;

    // Outer join on transcript: first appearance fixes the output order.
    std::vector<HaplotypeConsensus> merged;
    std::unordered_map<std::string, size_t> index;
    std::vector<std::vector<bool>> present;
    size_t duplicates = 0;
    size_t null_keys = 0;

    for (size_t s = 0; s < n_sources; ++s) {
        const Table& t = tables[s];
        const size_t tx = t.column_index("transcript");
        const size_t cls = t.column_index("class");
        for (size_t r = 0; r < t.num_rows(); ++r) {
            const Cell& key = t.at(r, tx);
            if (!key) {
                ++null_keys;
                continue;
            }
            auto [it, inserted] = index.emplace(*key, merged.size());
            if (inserted) {
                HaplotypeConsensus hc;
                hc.transcript = *key;
                hc.classes.assign(n_sources, NOT_FOUND_CLASS);
                merged.push_back(std::move(hc));
                present.emplace_back(n_sources, false);
            }
            const size_t m = it->second;
            if (present[m][s]) {
                ++duplicates;
                continue;
            }
            present[m][s] = true;

            HaplotypeConsensus& hc = merged[m];
            const Cell& c = t.at(r, cls);
            if (c) hc.classes[s] = *c;

            if (query) {
                if (!hc.reference_gene) hc.reference_gene = t.get(r, "reference_gene");
                if (!hc.reference_transcript) {
                    hc.reference_transcript = t.get(r, "reference_transcript");
                }
                if (!hc.relation) hc.relation = t.get(r, "relation");
            } else if (!hc.projection) {
                hc.projection = t.get(r, "projection");
            }
        }
    }

    if (duplicates > 0) {
        log_.warn("AmbiguousJoinWarning: " + std::to_string(duplicates) +
                  " repeated transcript keys within a haplotype table; first occurrence kept");
    }
    if (null_keys > 0) {
        log_.warn(std::to_string(null_keys) + " haplotype rows without a transcript skipped");
    }

    // Elect the best tier; classes outside the order count as NF.
    const size_t nf_rank = *rank.rank(NOT_FOUND_CLASS);
    std::map<std::string, size_t> unknown;
    for (auto& hc : merged) {
        size_t best = nf_rank;
        for (const auto& c : hc.classes) {
            auto r = rank.rank(c);
            if (!r) {
                ++unknown[c];
                continue;
            }
            if (*r < best) best = *r;
        }
        hc.consensus = rank.tiers()[best];
    }
    for (const auto& [cls, n] : unknown) {
        log_.warn("Class '" + cls + "' is not part of the consensus rule; " +
                  std::to_string(n) + " occurrences treated as " + NOT_FOUND_CLASS);
    }

    const auto t_end = std::chrono::steady_clock::now();
    log_.info("Merged " + std::to_string(n_sources) + " haplotype tables into " +
              std::to_string(merged.size()) + " transcripts (" +
              format_elapsed(t_start, t_end) + ")");
    return merged;
}

Table ConsensusMerger::to_table(const std::vector<HaplotypeConsensus>& merged) const {
    Table t(consensus_output_columns(source_));
    for (const auto& hc : merged) {
        if (source_ == ConsensusSource::QUERY) {
            t.append_row({hc.reference_gene, hc.reference_transcript, hc.transcript,
                          hc.relation, hc.consensus});
        } else {
            t.append_row({hc.projection, hc.transcript, hc.consensus});
        }
    }
    return t;
}

}  // namespace postoga
