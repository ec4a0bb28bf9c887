#include "sexp/span.hpp"
#include "sexp/errors.hpp"
#include <algorithm>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace sexp {

span::span(std::size_t start, std::size_t end){
    if(end < start){
        std::ostringstream os; os<<"span end "<<end<<" precedes start "<<start;
        throw std::invalid_argument(os.str());
    }
    if(end - start > max_span_length) throw span_range_error(start, end - start);
    start_ = start;
    len_ = static_cast<std::uint16_t>(end - start);
}

std::string span::to_string() const {
    std::ostringstream os; os<<'['<<start()<<','<<end()<<')';
    return os.str();
}

span merge(const span& a, const span& b){
    return span(std::min(a.start(), b.start()), std::max(a.end(), b.end()));
}

std::ostream& operator<<(std::ostream& os, const span& s){ return os<<s.to_string(); }

} // namespace sexp
