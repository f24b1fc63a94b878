#pragma once
// Gene-model conversion seam. The conversion itself is delegated to an
// external tool (bed2gtf / bed2gff) that takes a coordinate file and a
// gene-to-transcript map and writes a model file.

#include "postoga/logger.hpp"

#include <string>
#include <utility>

namespace postoga {

enum class ModelFormat {
    GTF,
    GFF,
    BED  // no conversion, the coordinate file is the model
};

// "gtf", "gff"/"gff3", "bed"; throws std::invalid_argument otherwise.
ModelFormat parse_model_format(const std::string& name);
const char* model_format_extension(ModelFormat format);

class GeneModelConverter {
public:
    virtual ~GeneModelConverter() = default;

    // Returns the written model path. Throws OutputError on failure.
    virtual std::string convert(const std::string& coordinates,
                                const std::string& isoforms,
                                const std::string& output) = 0;
};

// Runs `<tool> --bed <coords> --isoforms <map> --output <out>` through the
// shell and captures its output into the log.
class ExternalGeneModelConverter : public GeneModelConverter {
public:
    ExternalGeneModelConverter(std::string tool, Logger& log)
        : tool_(std::move(tool)), log_(log) {}

    std::string convert(const std::string& coordinates,
                        const std::string& isoforms,
                        const std::string& output) override;

    const std::string& tool() const { return tool_; }

    static std::string default_tool(ModelFormat format);

private:
    std::string tool_;
    Logger& log_;
};

// Single-quote an argument for /bin/sh.
std::string shell_quote(const std::string& arg);

}  // namespace postoga
