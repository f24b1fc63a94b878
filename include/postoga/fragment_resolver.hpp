#pragma once
// Fragment resolver: coordinate entries sharing one identifier are pieces
// of a single annotated locus. Each piece gets "#FG<n>" (1-based, file
// order, per identifier) and the group size becomes fragment_count of the
// unified rows with that identifier.

#include "postoga/bed.hpp"
#include "postoga/logger.hpp"
#include "postoga/projection.hpp"

#include <cstddef>
#include <vector>

namespace postoga {

struct FragmentResolution {
    std::vector<BedRecord> coordinates;
    ProjectionTable projections;
    bool fragmented = false;     // false: inputs passed through untouched
    size_t groups = 0;           // identifiers seen more than once
    size_t fragment_rows = 0;    // coordinate rows inside those groups
};

class FragmentResolver {
public:
    explicit FragmentResolver(Logger& log) : log_(log) {}

    FragmentResolution resolve(std::vector<BedRecord> coordinates,
                               ProjectionTable projections) const;

private:
    Logger& log_;
};

}  // namespace postoga
