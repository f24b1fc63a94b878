#include "postoga/gene_model.hpp"

#include "postoga/errors.hpp"

#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace postoga {

ModelFormat parse_model_format(const std::string& name) {
    if (name == "gtf") return ModelFormat::GTF;
    if (name == "gff" || name == "gff3") return ModelFormat::GFF;
    if (name == "bed") return ModelFormat::BED;
    throw std::invalid_argument("unknown model format '" + name + "' (expected gtf, gff or bed)");
}

const char* model_format_extension(ModelFormat format) {
    switch (format) {
        case ModelFormat::GTF: return "gtf";
        case ModelFormat::GFF: return "gff";
        case ModelFormat::BED: return "bed";
    }
    return "bed";
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string ExternalGeneModelConverter::default_tool(ModelFormat format) {
    switch (format) {
        case ModelFormat::GTF: return "bed2gtf";
        case ModelFormat::GFF: return "bed2gff";
        case ModelFormat::BED: break;
    }
    return {};
}

std::string ExternalGeneModelConverter::convert(const std::string& coordinates,
                                                const std::string& isoforms,
                                                const std::string& output) {
    if (tool_.empty()) {
        throw OutputError("no converter configured for " + output);
    }
    const std::string cmd = shell_quote(tool_) + " --bed " + shell_quote(coordinates) +
                            " --isoforms " + shell_quote(isoforms) +
                            " --output " + shell_quote(output) + " 2>&1";
    log_.info("Running " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw OutputError("cannot start " + tool_);
    }

    char buf[4096];
    std::string captured;
    while (std::fgets(buf, sizeof(buf), pipe)) {
        captured += buf;
        if (!captured.empty() && captured.back() == '\n') {
            captured.pop_back();
            log_.debug(tool_ + ": " + captured);
            captured.clear();
        }
    }
    if (!captured.empty()) log_.debug(tool_ + ": " + captured);

    const int status = pclose(pipe);
    if (status == -1) {
        throw OutputError("cannot collect exit status of " + tool_);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw OutputError(tool_ + " failed with exit code " + std::to_string(code) +
                          " while writing " + output);
    }
    return output;
}

}  // namespace postoga
