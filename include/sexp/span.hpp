// span.hpp - compact half-open byte range attached to every parsed atom
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>
#include <string>

namespace sexp
{

    // Longest byte range a single span can describe. Spans store their length
    // in 16 bits, so any token or bracketed region above this size is rejected
    // with span_range_error instead of being truncated.
    constexpr std::size_t max_span_length = std::numeric_limits<std::uint16_t>::max();

    class span
    {
    public:
        span() = default;
        // Throws std::invalid_argument when end < start and span_range_error
        // when end - start > max_span_length.
        span(std::size_t start, std::size_t end);

        std::size_t start() const { return start_; }
        std::size_t end() const { return start_ + static_cast<std::size_t>(len_); }
        std::size_t len() const { return static_cast<std::size_t>(len_); }
        bool empty() const { return len_ == 0; }
        bool contains(std::size_t offset) const { return offset >= start() && offset < end(); }

        std::string to_string() const;

        friend bool operator==(const span &a, const span &b) { return a.start_ == b.start_ && a.len_ == b.len_; }
        friend bool operator!=(const span &a, const span &b) { return !(a == b); }

    private:
        std::size_t start_ = 0;
        std::uint16_t len_ = 0;
    };

    // Smallest span covering both arguments. Throws span_range_error when the
    // covering range is too long.
    span merge(const span &a, const span &b);
    inline span operator+(const span &a, const span &b) { return merge(a, b); }

    std::ostream &operator<<(std::ostream &os, const span &s);

} // namespace sexp

namespace std
{
    template <>
    struct hash<sexp::span>
    {
        size_t operator()(const sexp::span &s) const noexcept
        {
            size_t h = std::hash<size_t>{}(s.start());
            return h ^ (std::hash<size_t>{}(s.len()) + 0x9e3779b9 + (h << 6) + (h >> 2));
        }
    };
} // namespace std
