#pragma once
// Haplotype consensus: N >= 2 unified (or loss) tables from different
// assemblies of one organism are outer-joined on the transcript key and,
// per transcript, the class with the lowest tier rank is elected.

#include "postoga/logger.hpp"
#include "postoga/projection.hpp"
#include "postoga/table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace postoga {

// Sentinel class for a transcript a source has no record of.
constexpr const char* NOT_FOUND_CLASS = "NF";

// Strict total order over classification tiers, parsed once from the
// wire format "I>PI>UL>L>M>PM>PG>NF". NF is always the worst tier.
class TierRank {
public:
    // Throws RuleError on an empty or duplicated tier.
    static TierRank parse(const std::string& rule);

    explicit TierRank(const std::vector<std::string>& tiers);

    // Rank of a tier (0 = best); nullopt for classes outside the order.
    std::optional<size_t> rank(const std::string& tier) const;
    bool contains(const std::string& tier) const { return rank(tier).has_value(); }

    // Tiers best-first, NF last.
    const std::vector<std::string>& tiers() const { return tiers_; }
    size_t size() const { return tiers_.size(); }

private:
    std::vector<std::string> tiers_;
    std::unordered_map<std::string, size_t> ranks_;
};

enum class ConsensusSource {
    QUERY,  // unified projection tables
    LOSS    // loss summary tables
};

ConsensusSource parse_consensus_source(const std::string& name);
const char* consensus_source_name(ConsensusSource source);

// Merger input columns
//   QUERY: reference_gene, reference_transcript, transcript, relation, class
//   LOSS:  projection, transcript, class
const std::vector<std::string>& consensus_input_columns(ConsensusSource source);

// Merger output columns
//   QUERY: reference_gene, reference_transcript, transcript, relation, consensus
//   LOSS:  projection, transcript, consensus
const std::vector<std::string>& consensus_output_columns(ConsensusSource source);

// Unified projections -> QUERY merger input (relation = orthology_class,
// class = loss_status). Rows without a query_transcript are skipped.
Table projections_to_consensus_input(const ProjectionTable& projections);

// loss_summary table -> LOSS merger input.
Table loss_to_consensus_input(const Table& loss);

struct HaplotypeConsensus {
    std::string transcript;
    std::vector<std::string> classes;  // one per source, NF when absent
    std::string consensus;
    // back-filled from the first source holding a value
    std::optional<std::string> reference_gene;
    std::optional<std::string> reference_transcript;
    std::optional<std::string> relation;
    std::optional<std::string> projection;
};

class ConsensusMerger {
public:
    ConsensusMerger(Logger& log, ConsensusSource source)
        : log_(log), source_(source) {}

    // Throws std::invalid_argument with fewer than two tables or when a
    // table lacks the input columns of this source.
    std::vector<HaplotypeConsensus> merge(const std::vector<Table>& tables,
                                          const TierRank& rank) const;

    Table to_table(const std::vector<HaplotypeConsensus>& merged) const;

private:
    Logger& log_;
    ConsensusSource source_;
};

}  // namespace postoga
