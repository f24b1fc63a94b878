#include "postoga/schema.hpp"
#include "postoga/errors.hpp"
#include "postoga/text_io.hpp"

#include <unordered_set>
#include <unordered_map>

namespace postoga {

namespace schema {

const ColumnSpec ORTHOLOGY_COLUMNS = {
    "reference_gene",
    "reference_transcript",
    "query_gene",
    "query_transcript",
    "orthology_class",
};

const ColumnSpec LOSS_COLUMNS = {
    "level",
    "query_transcript",
    "loss_status",
};

const ColumnSpec SCORE_COLUMNS = {
    "transcript",
    "chain",
    "orthology_score",
};

bool is_null_token(const std::string& value) {
    static const std::unordered_set<std::string> tokens = {
        "", "NA", "N/A", "NaN", "nan", "None", "null", "NULL",
    };
    return tokens.count(value) > 0;
}

}  // namespace schema

namespace {

void split_fields(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            return;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
}

Cell to_cell(std::string value) {
    if (schema::is_null_token(value)) return std::nullopt;
    return Cell(std::move(value));
}

}  // namespace

Table load_table(const std::string& path, const ColumnSpec& spec, bool skip_header) {
    auto reader = open_line_reader(path);
    Table table(spec);

    std::string line;
    std::vector<std::string> fields;
    size_t line_no = 0;
    bool header_pending = skip_header;

    while (reader->readline(line)) {
        ++line_no;
        if (header_pending) {
            header_pending = false;
            continue;
        }
        if (line.empty()) continue;

        split_fields(line, fields);
        if (fields.size() != spec.size()) {
            throw SchemaMismatchError(path, line_no, spec.size(), fields.size());
        }
        Row row;
        row.reserve(fields.size());
        for (auto& f : fields) row.push_back(to_cell(std::move(f)));
        table.append_row(std::move(row));
    }
    return table;
}

Table load_table_by_header(const std::string& path, const ColumnSpec& required) {
    auto reader = open_line_reader(path);

    std::string line;
    std::vector<std::string> header;
    size_t line_no = 0;
    while (reader->readline(line)) {
        ++line_no;
        if (!line.empty()) break;
    }
    if (line.empty()) {
        throw SchemaMismatchError(path, "empty file, expected a header");
    }
    split_fields(line, header);

    std::vector<size_t> positions;
    for (const auto& name : required) {
        size_t pos = header.size();
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) { pos = i; break; }
        }
        if (pos == header.size()) {
            throw SchemaMismatchError(path, "header lacks column '" + name + "'");
        }
        positions.push_back(pos);
    }

    Table table(required);
    std::vector<std::string> fields;
    while (reader->readline(line)) {
        ++line_no;
        if (line.empty()) continue;
        split_fields(line, fields);
        if (fields.size() != header.size()) {
            throw SchemaMismatchError(path, line_no, header.size(), fields.size());
        }
        Row row;
        row.reserve(positions.size());
        for (size_t pos : positions) row.push_back(to_cell(std::move(fields[pos])));
        table.append_row(std::move(row));
    }
    return table;
}

Table load_orthology_classification(const std::string& path) {
    return load_table(path, schema::ORTHOLOGY_COLUMNS, true);
}

Table load_loss_summary(const std::string& path) {
    return load_table(path, schema::LOSS_COLUMNS, true);
}

Table load_orthology_scores(const std::string& path) {
    return load_table(path, schema::SCORE_COLUMNS, true);
}

GeneOverrides load_gene_overrides(const std::string& path) {
    const Table table = load_table_by_header(path, {"projection", "query_gene"});

    // Last entry wins; order follows the first appearance of each projection.
    GeneOverrides overrides;
    overrides.reserve(table.num_rows());
    std::unordered_map<std::string, size_t> position;
    for (size_t r = 0; r < table.num_rows(); ++r) {
        const Cell& projection = table.at(r, 0);
        const Cell& gene = table.at(r, 1);
        if (!projection || !gene) continue;
        auto [it, inserted] = position.emplace(*projection, overrides.size());
        if (inserted) {
            overrides.emplace_back(*projection, *gene);
        } else {
            overrides[it->second].second = *gene;
        }
    }
    return overrides;
}

}  // namespace postoga
