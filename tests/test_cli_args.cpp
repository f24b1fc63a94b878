// Unit tests for CLI argument parsing

#include "cli/args.hpp"
#include "cli/subcommand.hpp"
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static void expect_base_exit(int expected_code, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)postoga::cli::parse_base_args(builder.argc(), builder.argv());
    } catch (const postoga::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

static void expect_haplotype_exit(int expected_code, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)postoga::cli::parse_haplotype_args(builder.argc(), builder.argv());
    } catch (const postoga::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_base_defaults() {
    std::cout << "Testing base defaults... ";
    ArgvBuilder builder;
    builder.add("base").add("--togadir").add("toga_out");
    auto opts = postoga::cli::parse_base_args(builder.argc(), builder.argv());
    assert(opts.togadir == "toga_out");
    assert(opts.outdir.empty());
    assert(opts.to == "gtf");
    assert(opts.target == "utr");
    assert(opts.level == "info");
    assert(opts.by_class.empty());
    assert(opts.by_status.empty());
    assert(!opts.min_score);
    assert(!opts.paralog_score);
    assert(!opts.only_table);
    assert(!opts.only_convert);
    assert(!opts.depure);
    std::cout << "PASSED\n";
}

void test_base_short_flags() {
    std::cout << "Testing base short flags... ";
    ArgvBuilder builder;
    builder.add("base")
           .add("-td").add("toga_out")
           .add("-o").add("results")
           .add("-bc").add("one2one,one2many")
           .add("-bl").add("I, PI")
           .add("-bs").add("0.5")
           .add("-bp").add("0.9")
           .add("-to").add("gff")
           .add("-tg").add("bed")
           .add("-w").add("iso.tsv")
           .add("-ot")
           .add("-d")
           .add("-L").add("debug");
    auto opts = postoga::cli::parse_base_args(builder.argc(), builder.argv());
    assert(opts.outdir == "results");
    assert(opts.by_class.size() == 2);
    assert(opts.by_class[1] == "one2many");
    assert(opts.by_status.size() == 2);
    assert(opts.by_status[1] == "PI");
    assert(*opts.min_score == 0.5);
    assert(*opts.paralog_score == 0.9);
    assert(opts.to == "gff");
    assert(opts.target == "bed");
    assert(opts.isoforms == "iso.tsv");
    assert(opts.only_table);
    assert(opts.depure);
    assert(opts.level == "debug");
    std::cout << "PASSED\n";
}

void test_base_validation_errors() {
    std::cout << "Testing base validation errors... ";
    {
        ArgvBuilder builder;
        builder.add("base");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td").add("x").add("-bs").add("high");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td").add("x").add("-bs").add("1.5");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td").add("x").add("--to").add("gff2");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td").add("x").add("-ot").add("-oc");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td");
        expect_base_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("-td").add("x").add("--frobnicate");
        expect_base_exit(1, builder);
    }
    std::cout << "PASSED\n";
}

void test_haplotype_args() {
    std::cout << "Testing haplotype args... ";
    {
        ArgvBuilder builder;
        builder.add("haplotype").add("-hp").add("h1,h2,h3");
        auto opts = postoga::cli::parse_haplotype_args(builder.argc(), builder.argv());
        assert(opts.paths.size() == 3);
        assert(opts.paths[2] == "h3");
        assert(opts.rule == "I>PI>UL>L>M>PM>PG>NF");
        assert(opts.source == "loss");
        assert(opts.outdir.empty());
    }
    {
        ArgvBuilder builder;
        builder.add("haplotype")
               .add("--haplotype-paths").add("h1,h2")
               .add("--rule").add("I>L")
               .add("--source").add("query")
               .add("--outdir").add("merged");
        auto opts = postoga::cli::parse_haplotype_args(builder.argc(), builder.argv());
        assert(opts.rule == "I>L");
        assert(opts.source == "query");
        assert(opts.outdir == "merged");
    }
    {
        ArgvBuilder builder;
        builder.add("haplotype").add("-hp").add("only_one");
        expect_haplotype_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("haplotype").add("-hp").add("h1,h2").add("-s").add("bed");
        expect_haplotype_exit(1, builder);
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help/version controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("base").add("--help");
        expect_base_exit(0, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("base").add("--version");
        expect_base_exit(0, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("haplotype").add("-h");
        expect_haplotype_exit(0, builder);
    }
    std::cout << "PASSED\n";
}

static int fake_late(int, char**) { return 7; }
static int fake_early(int, char**) { return 3; }

static void test_subcommand_registry() {
    std::cout << "Testing subcommand registry... ";
    auto& registry = postoga::cli::SubcommandRegistry::instance();
    assert(registry.register_command("zeta", "runs last", fake_late, 30));
    assert(registry.register_command("alpha", "runs first", fake_early, 5));
    assert(!registry.register_command("zeta", "duplicate", fake_early, 1));

    assert(registry.commands().size() == 2);
    assert(registry.commands()[0].name == "alpha");
    assert(registry.commands()[1].name == "zeta");
    assert(registry.commands()[1].description == "runs last");

    ArgvBuilder args;
    args.add("zeta");
    assert(registry.run_command("zeta", args.argc(), args.argv()) == 7);
    assert(!registry.has_command("missing"));
    assert(registry.run_command("missing", args.argc(), args.argv()) == 1);

    std::ostringstream help;
    registry.print_help(help, "postoga");
    const std::string text = help.str();
    assert(text.rfind(postoga::cli::version_banner() + "\n", 0) == 0);
    assert(text.find("  alpha  runs first\n") != std::string::npos);
    assert(text.find("alpha") < text.find("zeta"));
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_base_defaults();
    test_base_short_flags();
    test_base_validation_errors();
    test_haplotype_args();
    test_controlled_exits();
    test_subcommand_registry();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
