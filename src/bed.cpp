#include "postoga/bed.hpp"
#include "postoga/errors.hpp"
#include "postoga/text_io.hpp"

#include <cctype>

namespace postoga {

std::vector<BedRecord> read_bed(const std::string& path) {
    auto reader = open_line_reader(path);
    std::vector<BedRecord> records;

    std::string line;
    std::string* fields[BedRecord::NUM_FIELDS];
    size_t line_no = 0;

    while (reader->readline(line)) {
        ++line_no;
        if (line.empty()) continue;

        BedRecord rec;
        fields[0] = &rec.chrom;       fields[1] = &rec.start;
        fields[2] = &rec.end;         fields[3] = &rec.name;
        fields[4] = &rec.score;       fields[5] = &rec.strand;
        fields[6] = &rec.thick_start; fields[7] = &rec.thick_end;
        fields[8] = &rec.rgb;         fields[9] = &rec.block_count;
        fields[10] = &rec.block_sizes; fields[11] = &rec.block_starts;

        size_t n = 0;
        size_t start = 0;
        while (true) {
            size_t tab = line.find('\t', start);
            if (n < BedRecord::NUM_FIELDS) {
                *fields[n] = line.substr(start, tab == std::string::npos
                                                    ? std::string::npos
                                                    : tab - start);
            }
            ++n;
            if (tab == std::string::npos) break;
            start = tab + 1;
        }
        if (n != BedRecord::NUM_FIELDS) {
            throw SchemaMismatchError(path, line_no, BedRecord::NUM_FIELDS, n);
        }
        records.push_back(std::move(rec));
    }
    return records;
}

void write_bed(const std::vector<BedRecord>& records, const std::string& path) {
    TextWriter out(path, has_gz_suffix(path));
    std::string line;
    for (const auto& r : records) {
        line.clear();
        line += r.chrom;       line += '\t';
        line += r.start;       line += '\t';
        line += r.end;         line += '\t';
        line += r.name;        line += '\t';
        line += r.score;       line += '\t';
        line += r.strand;      line += '\t';
        line += r.thick_start; line += '\t';
        line += r.thick_end;   line += '\t';
        line += r.rgb;         line += '\t';
        line += r.block_count; line += '\t';
        line += r.block_sizes; line += '\t';
        line += r.block_starts;
        line += '\n';
        out.write(line);
    }
    out.close();
}

std::string fragment_suffix(size_t n) {
    return "#FG" + std::to_string(n);
}

std::string coordinate_key(const std::string& name) {
    const size_t pos = name.rfind("#FG");
    if (pos == std::string::npos || pos + 3 == name.size()) return name;
    for (size_t i = pos + 3; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return name;
    }
    return name.substr(0, pos);
}

std::string coordinate_helper(const std::string& key) {
    return key.substr(0, key.find('$'));
}

}  // namespace postoga
