#include "postoga/fragment_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>

namespace postoga {

FragmentResolution FragmentResolver::resolve(std::vector<BedRecord> coordinates,
                                             ProjectionTable projections) const {
    const auto t_start = std::chrono::steady_clock::now();

    std::unordered_map<std::string, uint32_t> occurrences;
    occurrences.reserve(coordinates.size());
    for (const auto& rec : coordinates) ++occurrences[rec.name];

    FragmentResolution res;
    for (const auto& [name, n] : occurrences) {
        if (n > 1) {
            ++res.groups;
            res.fragment_rows += n;
        }
    }

    if (res.groups == 0) {
        log_.info("No fragmented projections in " + std::to_string(coordinates.size()) +
                  " coordinate rows");
        res.coordinates = std::move(coordinates);
        res.projections = std::move(projections);
        return res;
    }

    // Running counter per identifier, in file order
    std::unordered_map<std::string, uint32_t> seen;
    seen.reserve(res.groups);
    for (auto& rec : coordinates) {
        const uint32_t n = occurrences[rec.name];
        if (n < 2) continue;
        const uint32_t idx = ++seen[rec.name];
        rec.name += fragment_suffix(idx);
    }

    size_t counted = 0;
    for (auto& p : projections) {
        p.fragment_count = 0;
        if (!p.query_transcript) continue;
        auto it = occurrences.find(*p.query_transcript);
        if (it != occurrences.end() && it->second > 1) {
            p.fragment_count = it->second;
            ++counted;
        }
    }

    res.fragmented = true;
    res.coordinates = std::move(coordinates);
    res.projections = std::move(projections);

    const auto t_end = std::chrono::steady_clock::now();
    log_.info("Resolved " + std::to_string(res.groups) + " fragmented projections spanning " +
              std::to_string(res.fragment_rows) + " coordinate rows (" +
              format_elapsed(t_start, t_end) + ")");
    log_.debug("Unified rows with a fragment count: " + std::to_string(counted));
    return res;
}

}  // namespace postoga
