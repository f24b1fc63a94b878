#include "postoga/table.hpp"
#include "postoga/errors.hpp"
#include "postoga/text_io.hpp"

#include <stdexcept>
#include <unordered_set>

namespace postoga {

Table::Table(std::vector<std::string> columns) : columns_(std::move(columns)) {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (!index_.emplace(columns_[i], i).second) {
            throw std::invalid_argument("duplicate column: " + columns_[i]);
        }
    }
}

bool Table::has_column(const std::string& name) const {
    return index_.find(name) != index_.end();
}

size_t Table::column_index(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("no such column: " + name);
    }
    return it->second;
}

void Table::add_column(const std::string& name, const Cell& fill) {
    if (has_column(name)) {
        throw std::invalid_argument("duplicate column: " + name);
    }
    index_.emplace(name, columns_.size());
    columns_.push_back(name);
    for (auto& row : rows_) row.push_back(fill);
}

void Table::rename_column(const std::string& from, const std::string& to) {
    if (from == to) return;
    const size_t idx = column_index(from);
    if (has_column(to)) {
        throw std::invalid_argument("duplicate column: " + to);
    }
    index_.erase(from);
    index_.emplace(to, idx);
    columns_[idx] = to;
}

void Table::append_row(Row row) {
    if (row.size() != columns_.size()) {
        throw std::invalid_argument("row has " + std::to_string(row.size()) +
                                    " cells, table has " +
                                    std::to_string(columns_.size()) + " columns");
    }
    rows_.push_back(std::move(row));
}

Table Table::select(const std::vector<std::string>& columns) const {
    std::vector<size_t> idx;
    idx.reserve(columns.size());
    for (const auto& name : columns) idx.push_back(column_index(name));

    Table out(columns);
    out.rows_.reserve(rows_.size());
    for (const auto& row : rows_) {
        Row r;
        r.reserve(idx.size());
        for (size_t i : idx) r.push_back(row[i]);
        out.rows_.push_back(std::move(r));
    }
    return out;
}

size_t Table::count_null(const std::string& column) const {
    const size_t c = column_index(column);
    size_t n = 0;
    for (const auto& row : rows_) {
        if (!row[c]) ++n;
    }
    return n;
}

size_t Table::fill_null_from(const std::string& target, const std::string& source) {
    const size_t t = column_index(target);
    const size_t s = column_index(source);
    size_t filled = 0;
    for (auto& row : rows_) {
        if (!row[t] && row[s]) {
            row[t] = row[s];
            ++filled;
        }
    }
    return filled;
}

size_t Table::fill_null_from_lookup(const std::string& target,
                                    const std::string& key,
                                    const Lookup& lookup) {
    const size_t t = column_index(target);
    const size_t k = column_index(key);
    size_t filled = 0;
    for (auto& row : rows_) {
        if (row[t] || !row[k]) continue;
        auto it = lookup.find(*row[k]);
        if (it != lookup.end()) {
            row[t] = it->second;
            ++filled;
        }
    }
    return filled;
}

Lookup Table::build_lookup(const std::string& key, const std::string& value) const {
    const size_t k = column_index(key);
    const size_t v = column_index(value);
    Lookup lookup;
    for (const auto& row : rows_) {
        if (row[k] && row[v]) lookup.emplace(*row[k], *row[v]);
    }
    return lookup;
}

Table Table::outer_join(const Table& right, const std::string& key,
                        JoinStats* stats) const {
    const size_t lk = column_index(key);
    const size_t rk = right.column_index(key);

    std::vector<std::string> out_columns = columns_;
    std::vector<size_t> right_cols;
    for (size_t c = 0; c < right.columns_.size(); ++c) {
        if (c == rk) continue;
        if (has_column(right.columns_[c])) {
            throw std::invalid_argument("join column collision: " + right.columns_[c]);
        }
        out_columns.push_back(right.columns_[c]);
        right_cols.push_back(c);
    }

    JoinStats local;
    JoinStats& js = stats ? *stats : local;
    js = JoinStats{};
    js.left_rows = rows_.size();
    js.right_rows = right.rows_.size();

    // first right row per key
    std::unordered_map<std::string, size_t> right_index;
    right_index.reserve(right.rows_.size());
    for (size_t r = 0; r < right.rows_.size(); ++r) {
        const Cell& k = right.rows_[r][rk];
        if (!k) {
            ++js.null_keys;
            continue;
        }
        if (!right_index.emplace(*k, r).second) ++js.right_duplicates;
    }

    Table out(std::move(out_columns));
    out.rows_.reserve(rows_.size() + right.rows_.size());

    std::vector<bool> right_used(right.rows_.size(), false);
    std::unordered_set<std::string> left_seen;
    left_seen.reserve(rows_.size());

    for (const auto& lrow : rows_) {
        const Cell& k = lrow[lk];
        Row row = lrow;
        row.resize(out.columns_.size());

        if (!k) {
            ++js.null_keys;
            ++js.left_only;
            out.rows_.push_back(std::move(row));
            continue;
        }
        if (!left_seen.insert(*k).second) {
            ++js.left_duplicates;
            continue;
        }

        auto it = right_index.find(*k);
        if (it != right_index.end()) {
            const Row& rrow = right.rows_[it->second];
            for (size_t i = 0; i < right_cols.size(); ++i) {
                row[columns_.size() + i] = rrow[right_cols[i]];
            }
            right_used[it->second] = true;
            ++js.matched;
        } else {
            ++js.left_only;
        }
        out.rows_.push_back(std::move(row));
    }

    for (size_t r = 0; r < right.rows_.size(); ++r) {
        const Cell& k = right.rows_[r][rk];
        if (right_used[r]) continue;
        if (k) {
            // only the first row of a duplicated key is joinable
            auto it = right_index.find(*k);
            if (it == right_index.end() || it->second != r) continue;
        }
        Row row(out.columns_.size());
        row[lk] = k;
        for (size_t i = 0; i < right_cols.size(); ++i) {
            row[columns_.size() + i] = right.rows_[r][right_cols[i]];
        }
        out.rows_.push_back(std::move(row));
        ++js.right_only;
    }

    return out;
}

std::map<std::string, size_t> Table::value_counts(const std::string& column,
                                                  const std::string& null_label) const {
    const size_t c = column_index(column);
    std::map<std::string, size_t> counts;
    for (const auto& row : rows_) {
        ++counts[row[c] ? *row[c] : null_label];
    }
    return counts;
}

size_t Table::count_unique(const std::string& column) const {
    const size_t c = column_index(column);
    std::unordered_set<std::string> seen;
    for (const auto& row : rows_) {
        if (row[c]) seen.insert(*row[c]);
    }
    return seen.size();
}

void write_table(const Table& table, const std::string& path, bool header) {
    TextWriter out(path, has_gz_suffix(path));
    std::string line;

    if (header) {
        for (size_t c = 0; c < table.num_columns(); ++c) {
            if (c) line += '\t';
            line += table.columns()[c];
        }
        line += '\n';
        out.write(line);
    }

    for (size_t r = 0; r < table.num_rows(); ++r) {
        line.clear();
        const Row& row = table.row(r);
        for (size_t c = 0; c < row.size(); ++c) {
            if (c) line += '\t';
            if (row[c]) line += *row[c];
        }
        line += '\n';
        out.write(line);
    }
    out.close();
}

}  // namespace postoga
