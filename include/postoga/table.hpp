#pragma once
// Column-named in-memory table with explicitly optional cells.
//
// This is the single tabular capability the reconciliation stages are
// written against: keyed outer join, filter-by-predicate, value counts
// and null-only fills. An absent cell is std::nullopt; fills never touch
// a cell that already holds a value.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace postoga {

using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

// First-wins key -> value map.
using Lookup = std::unordered_map<std::string, std::string>;

// Bookkeeping for one keyed outer join.
struct JoinStats {
    size_t left_rows = 0;
    size_t right_rows = 0;
    size_t matched = 0;
    size_t left_only = 0;
    size_t right_only = 0;
    size_t left_duplicates = 0;   // later left rows sharing a key (dropped)
    size_t right_duplicates = 0;  // later right rows sharing a key (dropped)
    size_t null_keys = 0;         // rows that cannot match at all

    size_t ambiguous() const { return left_duplicates + right_duplicates; }
};

class Table {
public:
    Table() = default;
    explicit Table(std::vector<std::string> columns);

    const std::vector<std::string>& columns() const { return columns_; }
    size_t num_columns() const { return columns_.size(); }
    size_t num_rows() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    bool has_column(const std::string& name) const;
    // Throws std::out_of_range naming the column when absent.
    size_t column_index(const std::string& name) const;

    // Append a column filled with `fill`.
    void add_column(const std::string& name, const Cell& fill = std::nullopt);
    void rename_column(const std::string& from, const std::string& to);

    // Row width must equal num_columns(); throws std::invalid_argument.
    void append_row(Row row);

    const Row& row(size_t r) const { return rows_[r]; }
    const Cell& at(size_t r, size_t c) const { return rows_[r][c]; }
    Cell& at(size_t r, size_t c) { return rows_[r][c]; }
    const Cell& get(size_t r, const std::string& column) const {
        return rows_[r][column_index(column)];
    }
    void set(size_t r, const std::string& column, Cell value) {
        rows_[r][column_index(column)] = std::move(value);
    }

    // Projection onto a subset of columns, in the given order.
    Table select(const std::vector<std::string>& columns) const;

    template <typename Pred>
    Table filter(Pred&& keep) const {
        Table out(columns_);
        for (size_t r = 0; r < rows_.size(); ++r) {
            if (keep(*this, r)) out.rows_.push_back(rows_[r]);
        }
        return out;
    }

    // Count of absent cells in a column.
    size_t count_null(const std::string& column) const;

    // target[r] = source[r] where target[r] is absent. Returns cells filled.
    size_t fill_null_from(const std::string& target, const std::string& source);

    // target[r] = lookup[key[r]] where target[r] is absent and key[r] is
    // present in the lookup. Returns cells filled.
    size_t fill_null_from_lookup(const std::string& target,
                                 const std::string& key,
                                 const Lookup& lookup);

    // key -> value from rows holding both cells; the first row wins.
    Lookup build_lookup(const std::string& key, const std::string& value) const;

    // Full outer join on `key`, which must exist in both tables. Output
    // columns are this table's columns followed by the right table's
    // non-key columns; names other than the key must not collide.
    // Left rows keep their order, unmatched right rows follow in their
    // order. A key seen again on either side is ambiguous: the first row
    // wins and the later ones are dropped. Rows with an absent key never
    // match and are kept.
    Table outer_join(const Table& right, const std::string& key,
                     JoinStats* stats = nullptr) const;

    // Histogram of present values; absent cells are counted under `null_label`.
    std::map<std::string, size_t> value_counts(const std::string& column,
                                               const std::string& null_label = "NA") const;
    size_t count_unique(const std::string& column) const;

private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Row> rows_;
};

// Writes a tab-separated table; gzip-compressed when `path` ends in ".gz".
// Absent cells are written as empty fields. Throws OutputError.
void write_table(const Table& table, const std::string& path, bool header = true);

}  // namespace postoga
