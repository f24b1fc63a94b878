#pragma once
// Fatal error taxonomy. Everything recoverable (ambiguous joins, empty
// filter results, score coercion) is logged instead of thrown.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace postoga {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A required input file is absent or cannot be opened.
class MissingInputError : public Error {
public:
    explicit MissingInputError(const std::string& path)
        : Error("missing input file: " + path), path_(path) {}

    MissingInputError(const std::string& path, const std::string& detail)
        : Error("missing input file: " + path + " (" + detail + ")"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Observed column layout differs from the column spec.
class SchemaMismatchError : public Error {
public:
    SchemaMismatchError(const std::string& path, size_t line,
                        size_t expected, size_t observed)
        : Error(path + ":" + std::to_string(line) + ": expected " +
                std::to_string(expected) + " columns, found " +
                std::to_string(observed)),
          path_(path), line_(line), expected_(expected), observed_(observed) {}

    SchemaMismatchError(const std::string& path, const std::string& detail)
        : Error(path + ": " + detail), path_(path) {}

    const std::string& path() const { return path_; }
    size_t line() const { return line_; }
    size_t expected() const { return expected_; }
    size_t observed() const { return observed_; }

private:
    std::string path_;
    size_t line_ = 0;
    size_t expected_ = 0;
    size_t observed_ = 0;
};

// Malformed consensus tier rule.
class RuleError : public Error {
public:
    explicit RuleError(const std::string& what) : Error("invalid rule: " + what) {}
};

// An output file or external converter step failed.
class OutputError : public Error {
public:
    explicit OutputError(const std::string& what) : Error(what) {}
};

}  // namespace postoga
