#pragma once
// BED12 coordinate records. Fields are carried as text; nothing
// downstream does coordinate arithmetic on them.

#include <cstddef>
#include <string>
#include <vector>

namespace postoga {

struct BedRecord {
    static constexpr size_t NUM_FIELDS = 12;

    std::string chrom;
    std::string start;
    std::string end;
    std::string name;           // projection id, 4th field
    std::string score;
    std::string strand;
    std::string thick_start;
    std::string thick_end;
    std::string rgb;
    std::string block_count;
    std::string block_sizes;
    std::string block_starts;
};

// Reads a headerless 12-column BED file.
// Throws MissingInputError / SchemaMismatchError.
std::vector<BedRecord> read_bed(const std::string& path);

// Writes records in the same 12-column layout, no header. Throws OutputError.
void write_bed(const std::vector<BedRecord>& records, const std::string& path);

// Fragment-group suffix appended by the fragment resolver: "#FG<n>".
std::string fragment_suffix(size_t n);

// Identifier with a trailing "#FG<n>" removed.
std::string coordinate_key(const std::string& name);

// Part of a coordinate key before its first '$'.
std::string coordinate_helper(const std::string& key);

}  // namespace postoga
