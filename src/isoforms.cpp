#include "postoga/isoforms.hpp"

#include "postoga/text_io.hpp"

#include <unordered_map>

namespace postoga {

IsoformMap build_isoform_map(const std::vector<BedRecord>& coordinates,
                             const ProjectionTable& projections) {
    std::unordered_map<std::string, const std::string*> gene_of;
    gene_of.reserve(projections.size());
    for (const auto& p : projections) {
        if (p.query_transcript) gene_of.emplace(*p.query_transcript, &p.query_gene);
    }

    IsoformMap out;
    out.reserve(coordinates.size());
    for (const auto& rec : coordinates) {
        const std::string key = coordinate_key(rec.name);
        auto it = gene_of.find(key);
        if (it == gene_of.end()) it = gene_of.find(coordinate_helper(key));
        if (it == gene_of.end()) continue;
        out.emplace_back(*it->second, rec.name);
    }
    return out;
}

void write_isoform_map(const IsoformMap& isoforms, const std::string& path) {
    TextWriter out(path, has_gz_suffix(path));
    std::string line;
    for (const auto& [gene, id] : isoforms) {
        line.clear();
        line += gene;
        line += '\t';
        line += id;
        line += '\n';
        out.write(line);
    }
    out.close();
}

}  // namespace postoga
