#pragma once
// Line-oriented text I/O for plain and gzip-compressed tables.
//
// LineReaderRapidgzip is defined in src/text_io_backend.cpp, which is the
// only TU that includes rapidgzip headers. Every other TU sees only the
// LineReader interface below; the zlib reader in src/text_io.cpp is the
// fallback and also handles uncompressed files transparently.

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

#include <zlib.h>

namespace postoga {

class LineReader {
public:
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

    virtual ~LineReader() = default;

    // Read one line (without trailing "\n" or "\r\n") into `line`.
    // Returns false on EOF. Throws MissingInputError on a read error.
    virtual bool readline(std::string& line) = 0;

    virtual const std::string& path() const = 0;
};

// rapidgzip backend; nullptr when HAVE_RAPIDGZIP is not defined or the
// file is not gzip-compressed.
std::unique_ptr<LineReader> make_gz_reader(const std::string& path);

// Open `path` for reading. Throws MissingInputError when the file is
// absent, not a regular file, or cannot be opened.
std::unique_ptr<LineReader> open_line_reader(const std::string& path);

// True when the path names an existing regular file.
bool file_exists(const std::string& path);

// Returns `path` if it exists, otherwise `path + ".gz"` if that exists,
// otherwise `path` unchanged (so the caller reports the plain name).
std::string resolve_input(const std::string& path);

// Buffered text writer; gzip-compressed when opened with compress=true.
class TextWriter {
public:
    TextWriter(const std::string& path, bool compress);
    ~TextWriter();

    TextWriter(const TextWriter&) = delete;
    TextWriter& operator=(const TextWriter&) = delete;

    void write(std::string_view text);
    // Flush and close; throws OutputError if the final write fails.
    void close();

    const std::string& path() const { return path_; }

private:
    void flush_buffer();

    std::string path_;
    std::string buffer_;
    gzFile gz_ = nullptr;
    std::FILE* plain_ = nullptr;
};

inline bool has_gz_suffix(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

}  // namespace postoga
