#pragma once

#include "postoga/bed.hpp"
#include "postoga/projection.hpp"

#include <string>
#include <utility>
#include <vector>

namespace postoga {

// (query_gene, coordinate id) pairs, coordinate file order.
using IsoformMap = std::vector<std::pair<std::string, std::string>>;

// Pairs every coordinate row with the query_gene of the projection it
// belongs to (see coordinate_matches); unmatched rows are left out.
IsoformMap build_isoform_map(const std::vector<BedRecord>& coordinates,
                             const ProjectionTable& projections);

// Two columns, no header. Throws OutputError.
void write_isoform_map(const IsoformMap& isoforms, const std::string& path);

}  // namespace postoga
