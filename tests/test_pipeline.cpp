// End-to-end tests of the base and haplotype run drivers on a small
// TOGA directory written to a temp dir. Gene-model conversion goes
// through a recording converter instead of bed2gtf.

#include "postoga/errors.hpp"
#include "postoga/pipeline.hpp"
#include "postoga/schema.hpp"
#include "postoga/text_io.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class RecordingConverter : public postoga::GeneModelConverter {
public:
    std::string convert(const std::string& coordinates,
                        const std::string& isoforms,
                        const std::string& output) override {
        ++calls;
        last_coordinates = coordinates;
        last_isoforms = isoforms;
        std::ofstream(output) << "converted\n";
        return output;
    }

    int calls = 0;
    std::string last_coordinates;
    std::string last_isoforms;
};

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    assert(out);
    out << content;
}

std::vector<std::string> read_lines(const std::string& path) {
    auto reader = postoga::open_line_reader(path);
    std::vector<std::string> lines;
    std::string line;
    while (reader->readline(line)) lines.push_back(line);
    return lines;
}

std::string bed_line(const std::string& name, int start) {
    std::ostringstream os;
    os << "chr1\t" << start << "\t" << start + 100 << "\t" << name
       << "\t0\t+\t" << start << "\t" << start + 100 << "\t0,0,200\t1\t100,\t0,\n";
    return os.str();
}

std::string make_togadir(const std::string& root, const std::string& name,
                         const std::string& loss_rows) {
    const std::string dir = root + "/" + name;
    fs::create_directories(dir);
    write_file(dir + "/" + postoga::schema::ORTHOLOGY_FILE,
               "t_gene\tt_transcript\tq_gene\tq_transcript\torthology_class\n"
               "G1\tT1\treg_1\tT1#1\tone2one\n"
               "G2\tT2\treg_2\tT2#3\tone2many\n"
               "G2\tT2\treg_3\tT2#4\tone2many\n");
    write_file(dir + "/" + postoga::schema::LOSS_FILE,
               "level\tentity\tstatus\n" + loss_rows);
    write_file(dir + "/" + postoga::schema::SCORES_FILE,
               "transcript\tchain\tpred\n"
               "T1\t1\t0.98\n"
               "T2\t3\t0.9\n"
               "T2\t4\t0.8\n");
    write_file(dir + "/" + postoga::schema::QUERY_GENES_FILE,
               "query_gene\tprojection\n"
               "reg_1\tT1#1\n");
    write_file(dir + "/" + postoga::schema::BED_UTR_FILE,
               bed_line("T1#1", 100) + bed_line("T2#3", 1000) +
               bed_line("T2#3", 2000) + bed_line("T2#4", 3000));
    write_file(dir + "/" + postoga::schema::BED_FILE,
               bed_line("T1#1", 100) + bed_line("T2#3", 1000) + bed_line("T2#4", 3000));
    return dir;
}

const char* DEFAULT_LOSS =
    "PROJECTION\tT1#1\tI\n"
    "PROJECTION\tT2#3\tI\n"
    "PROJECTION\tT2#4\tL\n"
    "TRANSCRIPT\tT1\tI\n";

size_t count_run_dirs(const std::string& parent) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(parent)) {
        if (entry.path().filename().string().rfind("POSTOGA_", 0) == 0) ++n;
    }
    return n;
}

}  // namespace

void test_run_dir_name() {
    std::cout << "Testing run directory name... ";
    const std::string name = postoga::make_run_dir_name();
    assert(name.size() == std::string("POSTOGA_XXXXX_YYYYmmdd_HHMMSS").size());
    assert(name.rfind("POSTOGA_", 0) == 0);
    for (size_t i = 8; i < 13; ++i) {
        const char c = name[i];
        assert((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'));
    }
    assert(name[13] == '_');
    assert(name[22] == '_');
    std::cout << "PASSED\n";
}

void test_base_run_default(const std::string& tmpdir) {
    std::cout << "Testing default base run... ";
    const std::string toga = make_togadir(tmpdir, "default", DEFAULT_LOSS);
    std::ostringstream sink;
    postoga::Logger log(postoga::LogLevel::Warn, sink);
    RecordingConverter converter;

    postoga::BaseRunConfig config;
    config.togadir = toga;
    postoga::BaseRun run(config, log, &converter);
    const auto res = run.run();

    assert(fs::path(res.run_dir).parent_path() == fs::path(toga));
    assert(fs::is_regular_file(res.run_dir + "/" + postoga::outputs::LOG));
    assert(res.fragmented);
    assert(!res.filtered);
    assert(res.projections == 3);
    assert(res.coordinates == 4);

    // fragment-suffixed coordinates become the annotation
    assert(res.annotation == res.run_dir + "/" + postoga::outputs::FRAGMENTED_BED);
    auto bed = postoga::read_bed(res.annotation);
    assert(bed.size() == 4);
    assert(bed[1].name == "T2#3#FG1");
    assert(bed[2].name == "T2#3#FG2");

    auto table = read_lines(res.table);
    assert(table.size() == 4);
    assert(table[0] ==
           "reference_gene\treference_transcript\tquery_gene\tquery_transcript\t"
           "orthology_class\tloss_status\torthology_score\tfragment_count");
    assert(table[1] == "G1\tT1\treg_1\tT1#1\tone2one\tI\t0.98\t0");
    assert(table[2] == "G2\tT2\treg_2\tT2#3\tone2many\tI\t0.9\t2");
    assert(table[3] == "G2\tT2\treg_3\tT2#4\tone2many\tL\t0.8\t0");

    auto isoforms = read_lines(res.isoforms);
    assert(isoforms.size() == 4);
    assert(isoforms[0] == "reg_1\tT1#1");
    assert(isoforms[1] == "reg_2\tT2#3#FG1");
    assert(isoforms[3] == "reg_3\tT2#4");

    assert(converter.calls == 1);
    assert(converter.last_coordinates == res.annotation);
    assert(converter.last_isoforms == res.isoforms);
    assert(res.model == res.run_dir + "/fragmented.gtf.gz");
    std::cout << "PASSED\n";
}

void test_base_run_filtered_table_only(const std::string& tmpdir) {
    std::cout << "Testing filtered table-only run... ";
    const std::string toga = make_togadir(tmpdir, "filtered", DEFAULT_LOSS);
    const std::string outdir = tmpdir + "/filtered_out";
    postoga::Logger log(postoga::LogLevel::Off);

    postoga::BaseRunConfig config;
    config.togadir = toga;
    config.outdir = outdir;
    config.target = postoga::AnnotationTarget::BED;
    config.only_table = true;
    config.filters.loss_statuses = {"I"};
    postoga::BaseRun run(config, log, nullptr);
    const auto res = run.run();

    assert(fs::path(res.run_dir).parent_path() == fs::path(outdir));
    assert(!res.fragmented);
    assert(res.filtered);
    assert(res.model.empty());
    assert(res.projections == 2);
    assert(res.annotation == res.run_dir + "/" + postoga::outputs::FILTERED_BED);
    auto bed = postoga::read_bed(res.annotation);
    assert(bed.size() == 2);
    assert(bed[0].name == "T1#1");
    assert(bed[1].name == "T2#3");
    assert(read_lines(res.table).size() == 3);
    assert(res.isoforms.empty());
    assert(!fs::exists(res.run_dir + "/" + postoga::outputs::ISOFORMS));
    std::cout << "PASSED\n";
}

void test_base_run_user_isoforms(const std::string& tmpdir) {
    std::cout << "Testing user isoform map with fragments... ";
    const std::string toga = make_togadir(tmpdir, "userisoforms", DEFAULT_LOSS);
    const std::string user_map = tmpdir + "/user_isoforms.tsv";
    write_file(user_map, "reg_1\tT1#1\nreg_2\tT2#3\n");
    std::ostringstream sink;
    postoga::Logger log(postoga::LogLevel::Warn, sink);
    RecordingConverter converter;

    postoga::BaseRunConfig config;
    config.togadir = toga;
    config.isoforms = user_map;
    postoga::BaseRun run(config, log, &converter);
    const auto res = run.run();

    assert(res.fragmented);
    assert(res.isoforms == user_map);
    assert(!fs::exists(res.run_dir + "/" + postoga::outputs::ISOFORMS));
    assert(converter.last_isoforms == user_map);
    assert(sink.str().find(user_map) != std::string::npos);
    assert(sink.str().find("#FG<n>") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_base_run_bed_model(const std::string& tmpdir) {
    std::cout << "Testing bed model and only-convert... ";
    const std::string toga = make_togadir(tmpdir, "bedmodel", DEFAULT_LOSS);
    postoga::Logger log(postoga::LogLevel::Off);

    postoga::BaseRunConfig config;
    config.togadir = toga;
    config.target = postoga::AnnotationTarget::BED;
    config.format = postoga::ModelFormat::BED;
    config.only_convert = true;
    postoga::BaseRun run(config, log, nullptr);
    const auto res = run.run();

    assert(res.table.empty());
    assert(!fs::exists(res.run_dir + "/" + postoga::outputs::TABLE));
    assert(res.model == res.annotation);
    assert(res.annotation == toga + "/" + postoga::schema::BED_FILE);
    std::cout << "PASSED\n";
}

void test_missing_input_writes_nothing(const std::string& tmpdir) {
    std::cout << "Testing missing input... ";
    const std::string toga = make_togadir(tmpdir, "missing", DEFAULT_LOSS);
    fs::remove(toga + "/" + postoga::schema::SCORES_FILE);
    postoga::Logger log(postoga::LogLevel::Off);
    RecordingConverter converter;

    postoga::BaseRunConfig config;
    config.togadir = toga;
    postoga::BaseRun run(config, log, &converter);
    bool threw = false;
    try {
        (void)run.run();
    } catch (const postoga::MissingInputError& e) {
        threw = true;
        assert(e.path() == toga + "/" + postoga::schema::SCORES_FILE);
    }
    assert(threw);
    assert(count_run_dirs(toga) == 0);
    assert(converter.calls == 0);

    threw = false;
    try {
        (void)postoga::TogaInputs::locate(tmpdir + "/nope", postoga::AnnotationTarget::UTR);
    } catch (const postoga::MissingInputError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_depure(const std::string& tmpdir) {
    std::cout << "Testing depure... ";
    const std::string parent = tmpdir + "/depure";
    fs::create_directories(parent + "/POSTOGA_ABCDE_20240101_000000");
    write_file(parent + "/POSTOGA_ABCDE_20240101_000000/toga.table.gz", "x");
    write_file(parent + "/" + postoga::outputs::TABLE, "x");
    write_file(parent + "/query_annotation.gtf.gz", "x");
    write_file(parent + "/" + postoga::schema::ORTHOLOGY_FILE, "keep");

    postoga::Logger log(postoga::LogLevel::Off);
    assert(postoga::depure_outputs(parent, log) == 3);
    assert(count_run_dirs(parent) == 0);
    assert(!fs::exists(parent + "/" + postoga::outputs::TABLE));
    assert(fs::exists(parent + "/" + postoga::schema::ORTHOLOGY_FILE));
    std::cout << "PASSED\n";
}

void test_haplotype_loss(const std::string& tmpdir) {
    std::cout << "Testing haplotype consensus from loss tables... ";
    const std::string h1 = make_togadir(tmpdir, "hap1", DEFAULT_LOSS);
    const std::string h2 = make_togadir(tmpdir, "hap2",
                                        "PROJECTION\tT1#1\tL\n"
                                        "PROJECTION\tT2#4\tI\n");
    postoga::Logger log(postoga::LogLevel::Off);

    postoga::HaplotypeRunConfig config;
    config.paths = {h1, h2};
    const std::string out = postoga::run_haplotype(config, log);
    assert(out == h1 + "/" + postoga::outputs::HAPLOTYPE);

    auto lines = read_lines(out);
    assert(lines.size() == 5);
    assert(lines[0] == "projection\ttranscript\tconsensus");
    assert(lines[1] == "PROJECTION\tT1#1\tI");
    assert(lines[2] == "PROJECTION\tT2#3\tI");
    assert(lines[3] == "PROJECTION\tT2#4\tI");
    assert(lines[4] == "TRANSCRIPT\tT1\tI");
    std::cout << "PASSED\n";
}

void test_haplotype_query(const std::string& tmpdir) {
    std::cout << "Testing haplotype consensus from unified tables... ";
    const std::string h1 = make_togadir(tmpdir, "qhap1", DEFAULT_LOSS);
    const std::string h2 = make_togadir(tmpdir, "qhap2",
                                        "PROJECTION\tT1#1\tL\n"
                                        "PROJECTION\tT2#3\tM\n"
                                        "PROJECTION\tT2#4\tPI\n");
    const std::string outdir = tmpdir + "/qhap_out";
    postoga::Logger log(postoga::LogLevel::Off);

    postoga::HaplotypeRunConfig config;
    config.paths = {h1, h2};
    config.source = postoga::ConsensusSource::QUERY;
    config.outdir = outdir;
    const std::string out = postoga::run_haplotype(config, log);
    assert(out == outdir + "/" + postoga::outputs::HAPLOTYPE);

    auto lines = read_lines(out);
    assert(lines.size() == 4);
    assert(lines[0] == "reference_gene\treference_transcript\ttranscript\trelation\tconsensus");
    assert(lines[1] == "G1\tT1\tT1#1\tone2one\tI");
    assert(lines[2] == "G2\tT2\tT2#3\tone2many\tI");
    assert(lines[3] == "G2\tT2\tT2#4\tone2many\tPI");

    config.rule = "I>>L";
    bool threw = false;
    try {
        (void)postoga::run_haplotype(config, log);
    } catch (const postoga::RuleError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    char tmp_template[] = "/tmp/postoga_pipeline_XXXXXX";
    char* tmp = mkdtemp(tmp_template);
    if (!tmp) {
        std::cerr << "Failed to create temp dir\n";
        return 2;
    }
    const std::string tmpdir = tmp;

    test_run_dir_name();
    test_base_run_default(tmpdir);
    test_base_run_filtered_table_only(tmpdir);
    test_base_run_user_isoforms(tmpdir);
    test_base_run_bed_model(tmpdir);
    test_missing_input_writes_nothing(tmpdir);
    test_depure(tmpdir);
    test_haplotype_loss(tmpdir);
    test_haplotype_query(tmpdir);

    std::cout << "\nAll pipeline tests passed!\n";
    return 0;
}
