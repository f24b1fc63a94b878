#ifndef POSTOGA_CLI_ARGS_HPP
#define POSTOGA_CLI_ARGS_HPP

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace postoga {
namespace cli {

// Thrown by the parsers instead of calling exit(): 0 after --help or
// --version, 1 for a usage error (message already formatted).
class ParseArgsExit {
public:
    explicit ParseArgsExit(int code, std::string message = {})
        : code_(code), message_(std::move(message)) {}

    int exit_code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    int code_;
    std::string message_;
};

struct BaseOptions {
    std::string togadir;
    std::string outdir;                        // default: togadir
    std::vector<std::string> by_class;         // orthology_class allow-list
    std::vector<std::string> by_status;        // loss_status allow-list
    std::optional<double> min_score;
    std::optional<double> paralog_score;
    std::string to = "gtf";                    // gtf, gff, bed
    std::string target = "utr";                // bed, utr
    std::string isoforms;                      // user isoform map
    bool only_table = false;
    bool only_convert = false;
    bool depure = false;
    std::string level = "info";
};

struct HaplotypeOptions {
    std::vector<std::string> paths;
    std::string rule = "I>PI>UL>L>M>PM>PG>NF";
    std::string source = "loss";               // query, loss
    std::string outdir;                        // default: first path
    std::string target = "utr";
    std::string level = "info";
};

// "postoga v<version>" heading shared by every help screen.
std::string version_banner();
void print_version();
void print_base_usage(const char* program_name);
void print_haplotype_usage(const char* program_name);

// Throws ParseArgsExit for --help/--version (code 0) and for missing or
// malformed arguments (code 1).
BaseOptions parse_base_args(int argc, char* argv[]);
HaplotypeOptions parse_haplotype_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace postoga

#endif  // POSTOGA_CLI_ARGS_HPP
