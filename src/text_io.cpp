#include "postoga/text_io.hpp"
#include "postoga/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace postoga {

namespace {

// zlib reader; gzopen reads uncompressed files transparently.
class GzLineReaderZlib : public LineReader {
public:
    explicit GzLineReaderZlib(const std::string& path) : path_(path) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw MissingInputError(path, std::strerror(errno));
        }
        gzbuffer(gz_, GZBUF_SIZE);
    }

    ~GzLineReaderZlib() override {
        if (gz_) gzclose(gz_);
    }

    bool readline(std::string& line) override {
        line.clear();
        bool got_any = false;
        while (gzgets(gz_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = std::strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                strip_cr(line);
                return true;
            }
            // line longer than the buffer: keep reading
            line.append(buffer_, len);
        }

        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_BUF_ERROR) {
            throw MissingInputError(path_, std::string("read error: ") + msg);
        }
        if (got_any) strip_cr(line);
        return got_any;
    }

    const std::string& path() const override { return path_; }

private:
    static void strip_cr(std::string& line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }

    std::string path_;
    gzFile gz_ = nullptr;
    char buffer_[65536];
};

}  // namespace

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string resolve_input(const std::string& path) {
    if (file_exists(path)) return path;
    const std::string gz = path + ".gz";
    if (file_exists(gz)) return gz;
    return path;
}

std::unique_ptr<LineReader> open_line_reader(const std::string& path) {
    if (!file_exists(path)) {
        throw MissingInputError(path);
    }
    if (auto fast = make_gz_reader(path)) {
        return fast;
    }
    return std::make_unique<GzLineReaderZlib>(path);
}

TextWriter::TextWriter(const std::string& path, bool compress) : path_(path) {
    if (compress) {
        gz_ = gzopen(path.c_str(), "wb");
        if (!gz_) throw OutputError("cannot create " + path);
        gzbuffer(gz_, LineReader::GZBUF_SIZE);
    } else {
        plain_ = std::fopen(path.c_str(), "wb");
        if (!plain_) {
            throw OutputError("cannot create " + path + ": " + std::strerror(errno));
        }
    }
    buffer_.reserve(1 << 20);
}

TextWriter::~TextWriter() {
    // Destructor path only releases handles; close() reports errors.
    if (gz_) gzclose(gz_);
    if (plain_) std::fclose(plain_);
}

void TextWriter::write(std::string_view text) {
    buffer_.append(text.data(), text.size());
    if (buffer_.size() >= (1 << 20)) flush_buffer();
}

void TextWriter::flush_buffer() {
    if (buffer_.empty()) return;
    if (gz_) {
        int written = gzwrite(gz_, buffer_.data(), static_cast<unsigned>(buffer_.size()));
        if (written <= 0 || static_cast<size_t>(written) != buffer_.size()) {
            throw OutputError("write failed: " + path_);
        }
    } else if (plain_) {
        if (std::fwrite(buffer_.data(), 1, buffer_.size(), plain_) != buffer_.size()) {
            throw OutputError("write failed: " + path_);
        }
    }
    buffer_.clear();
}

void TextWriter::close() {
    flush_buffer();
    if (gz_) {
        int rc = gzclose(gz_);
        gz_ = nullptr;
        if (rc != Z_OK) throw OutputError("cannot finish " + path_);
    }
    if (plain_) {
        int rc = std::fclose(plain_);
        plain_ = nullptr;
        if (rc != 0) throw OutputError("cannot finish " + path_);
    }
}

}  // namespace postoga
