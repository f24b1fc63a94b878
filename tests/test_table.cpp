// Unit tests for the column-named table: keyed outer join, null-only
// fills, first-wins lookups and the gzip table writer.

#include "postoga/table.hpp"
#include "postoga/text_io.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using postoga::Cell;
using postoga::JoinStats;
using postoga::Table;

static Table make_left() {
    Table t({"id", "a"});
    t.append_row({Cell("k1"), Cell("a1")});
    t.append_row({Cell("k2"), Cell("a2")});
    t.append_row({std::nullopt, Cell("a3")});
    t.append_row({Cell("k1"), Cell("a1-dup")});
    return t;
}

static Table make_right() {
    Table t({"id", "b"});
    t.append_row({Cell("k2"), Cell("b2")});
    t.append_row({Cell("k4"), Cell("b4")});
    t.append_row({Cell("k2"), Cell("b2-dup")});
    t.append_row({std::nullopt, Cell("b5")});
    return t;
}

void test_outer_join_order_and_first_wins() {
    std::cout << "Testing outer join order and first-wins... ";
    JoinStats js;
    Table out = make_left().outer_join(make_right(), "id", &js);

    assert(out.columns().size() == 3);
    assert(out.columns()[2] == "b");
    // k1, k2, null(left), k4, null(right)
    assert(out.num_rows() == 5);
    assert(*out.get(0, "id") == "k1");
    assert(!out.get(0, "b"));
    assert(*out.get(1, "id") == "k2");
    assert(*out.get(1, "b") == "b2");
    assert(!out.get(2, "id"));
    assert(*out.get(2, "a") == "a3");
    assert(*out.get(3, "id") == "k4");
    assert(!out.get(3, "a"));
    assert(*out.get(3, "b") == "b4");
    assert(!out.get(4, "id"));
    assert(*out.get(4, "b") == "b5");

    assert(js.left_rows == 4);
    assert(js.right_rows == 4);
    assert(js.matched == 1);
    assert(js.left_duplicates == 1);
    assert(js.right_duplicates == 1);
    assert(js.ambiguous() == 2);
    assert(js.null_keys == 2);
    assert(js.right_only == 2);
    std::cout << "PASSED\n";
}

void test_outer_join_column_collision() {
    std::cout << "Testing outer join column collision... ";
    Table left({"id", "x"});
    Table right({"id", "x"});
    bool threw = false;
    try {
        (void)left.outer_join(right, "id");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_fill_null_only() {
    std::cout << "Testing null-only fills... ";
    Table t({"target", "source"});
    t.append_row({Cell("keep"), Cell("s1")});
    t.append_row({std::nullopt, Cell("s2")});
    t.append_row({std::nullopt, std::nullopt});

    assert(t.fill_null_from("target", "source") == 1);
    assert(*t.get(0, "target") == "keep");
    assert(*t.get(1, "target") == "s2");
    assert(!t.get(2, "target"));
    assert(t.count_null("target") == 1);
    std::cout << "PASSED\n";
}

void test_lookup_first_wins() {
    std::cout << "Testing lookup first-wins... ";
    Table t({"tx", "gene"});
    t.append_row({Cell("T1"), std::nullopt});
    t.append_row({Cell("T1"), Cell("G1")});
    t.append_row({Cell("T1"), Cell("G1b")});
    t.append_row({Cell("T2"), Cell("G2")});
    t.append_row({Cell("T3"), std::nullopt});

    auto lookup = t.build_lookup("tx", "gene");
    assert(lookup.size() == 2);
    assert(lookup.at("T1") == "G1");

    assert(t.fill_null_from_lookup("gene", "tx", lookup) == 1);
    assert(*t.get(0, "gene") == "G1");
    assert(*t.get(2, "gene") == "G1b");
    assert(!t.get(4, "gene"));
    std::cout << "PASSED\n";
}

void test_select_filter_counts() {
    std::cout << "Testing select, filter and value counts... ";
    Table t({"a", "b", "c"});
    t.append_row({Cell("1"), Cell("x"), Cell("p")});
    t.append_row({Cell("2"), std::nullopt, Cell("q")});
    t.append_row({Cell("3"), Cell("x"), Cell("r")});

    Table s = t.select({"c", "a"});
    assert(s.columns().size() == 2);
    assert(*s.get(1, "c") == "q");

    Table f = t.filter([](const Table& tt, size_t r) {
        const Cell& b = tt.get(r, "b");
        return b && *b == "x";
    });
    assert(f.num_rows() == 2);
    assert(*f.get(1, "a") == "3");

    auto counts = t.value_counts("b");
    assert(counts.at("x") == 2);
    assert(counts.at("NA") == 1);
    assert(t.count_unique("b") == 1);

    bool threw = false;
    try {
        t.append_row({Cell("4")});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_write_table_gz(const std::string& tmpdir) {
    std::cout << "Testing gzip table writer... ";
    Table t({"a", "b"});
    t.append_row({Cell("1"), std::nullopt});
    t.append_row({std::nullopt, Cell("y")});

    const std::string path = tmpdir + "/table.tsv.gz";
    postoga::write_table(t, path);

    auto reader = postoga::open_line_reader(path);
    std::vector<std::string> lines;
    std::string line;
    while (reader->readline(line)) lines.push_back(line);
    assert(lines.size() == 3);
    assert(lines[0] == "a\tb");
    assert(lines[1] == "1\t");
    assert(lines[2] == "\ty");
    std::cout << "PASSED\n";
}

int main() {
    char tmp_template[] = "/tmp/postoga_table_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }

    test_outer_join_order_and_first_wins();
    test_outer_join_column_collision();
    test_fill_null_only();
    test_lookup_first_wins();
    test_select_filter_counts();
    test_write_table_gz(tmp);

    std::cout << "\nAll table tests passed!\n";
    return 0;
}
