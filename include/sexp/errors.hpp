// errors.hpp - exception hierarchy raised by the reader
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace sexp
{

    // Root of everything the reader throws on bad input. Callers that only care
    // about "did this source unit parse" catch this one.
    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // A span (token or bracketed region) longer than max_span_length bytes.
    class span_range_error : public parse_error
    {
    public:
        span_range_error(std::size_t start, std::size_t length);

        std::size_t start() const { return start_; }
        std::size_t length() const { return length_; }

    private:
        std::size_t start_;
        std::size_t length_;
    };

    // No grammar alternative matched at offset(). expected() lists the labelled
    // alternatives that were being attempted there, in grammar order.
    class syntax_error : public parse_error
    {
    public:
        syntax_error(std::string source, std::size_t offset, std::size_t line, std::size_t column,
                     std::vector<std::string> expected);

        const std::string &source() const { return source_; }
        std::size_t offset() const { return offset_; }
        std::size_t line() const { return line_; }
        std::size_t column() const { return column_; }
        const std::vector<std::string> &expected() const { return expected_; }

    private:
        std::string source_;
        std::size_t offset_;
        std::size_t line_;
        std::size_t column_;
        std::vector<std::string> expected_;
    };

    // A list opened deeper than parse_options::max_depth.
    class nesting_error : public parse_error
    {
    public:
        nesting_error(std::size_t offset, std::size_t limit);

        std::size_t offset() const { return offset_; }
        std::size_t limit() const { return limit_; }

    private:
        std::size_t offset_;
        std::size_t limit_;
    };

    // "expected one of: a, b, c" (or "expected a" for a single alternative).
    std::string format_expected(const std::vector<std::string> &expected);

} // namespace sexp
