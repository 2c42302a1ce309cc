#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace semsearch {

// Base of every failure the search engine reports.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Provider unreachable, non-2xx status, malformed payload, or a vector
// count that does not match the number of inputs.
class EmbeddingFailure : public Error {
public:
    explicit EmbeddingFailure(const std::string& what) : Error(what) {}
};

// Vector length inconsistent with the configured dimension.
class DimensionMismatch : public Error {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : Error("dimension mismatch: expected " + std::to_string(expected) +
                ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class StoreWriteFailure : public Error {
public:
    explicit StoreWriteFailure(const std::string& what) : Error(what) {}
};

class StoreQueryFailure : public Error {
public:
    explicit StoreQueryFailure(const std::string& what) : Error(what) {}
};

// Malformed source record. Carries the 1-based line number.
class InputFormatError : public Error {
public:
    InputFormatError(size_t line, const std::string& what)
        : Error("line " + std::to_string(line) + ": " + what), line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

class QueryCancelled : public Error {
public:
    QueryCancelled() : Error("query cancelled") {}
};

} // namespace semsearch
