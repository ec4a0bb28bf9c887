#include "sexp/errors.hpp"
#include "sexp/span.hpp"
#include <sstream>
#include <utility>

namespace sexp {

static std::string span_range_message(std::size_t start, std::size_t length){
    std::ostringstream os;
    os<<"span starting at byte "<<start<<" is "<<length<<" bytes long; a single atom may cover at most "<<max_span_length<<" bytes";
    return os.str();
}

static std::string syntax_message(const std::string& source, std::size_t offset, std::size_t line, std::size_t column, const std::vector<std::string>& expected){
    std::ostringstream os;
    os<<source<<':'<<line<<':'<<column<<": syntax error at byte "<<offset<<": "<<format_expected(expected);
    return os.str();
}

static std::string nesting_message(std::size_t offset, std::size_t limit){
    std::ostringstream os;
    os<<"list opened at byte "<<offset<<" exceeds the nesting limit of "<<limit;
    return os.str();
}

span_range_error::span_range_error(std::size_t start, std::size_t length)
    : parse_error(span_range_message(start, length)), start_(start), length_(length) {}

syntax_error::syntax_error(std::string source, std::size_t offset, std::size_t line, std::size_t column, std::vector<std::string> expected)
    : parse_error(syntax_message(source, offset, line, column, expected)),
      source_(std::move(source)), offset_(offset), line_(line), column_(column), expected_(std::move(expected)) {}

nesting_error::nesting_error(std::size_t offset, std::size_t limit)
    : parse_error(nesting_message(offset, limit)), offset_(offset), limit_(limit) {}

std::string format_expected(const std::vector<std::string>& expected){
    if(expected.empty()) return "unexpected input";
    if(expected.size()==1) return "expected " + expected.front();
    std::string out = "expected one of: ";
    for(size_t i=0;i<expected.size(); ++i){
        if(i) out += ", ";
        out += expected[i];
    }
    return out;
}

} // namespace sexp
