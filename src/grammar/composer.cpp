#include "fee/grammar/composer.hpp"
#include <algorithm>

namespace fee {

SourceLocation SourceMap::locate(size_t offset) const {
    if(segments_.empty()) return {};
    auto it = std::upper_bound(segments_.begin(), segments_.end(), offset,
        [](size_t off, const std::pair<size_t, SourceLocation>& seg){ return off < seg.first; });
    if(it != segments_.begin()) --it;
    SourceLocation at = it->second;
    if(at.known() && offset >= it->first) at.col += static_cast<int>(offset - it->first);
    return at;
}

std::string parse_error_message(const tao::pegtl::parse_error& e){
    std::string msg = e.what();
    if(!e.positions().empty()){
        std::string prefix = tao::pegtl::to_string(e.positions().front()) + ": ";
        if(msg.compare(0, prefix.size(), prefix)==0) msg.erase(0, prefix.size());
    }
    return msg;
}

void throw_syntax_error(const tao::pegtl::parse_error& e, const SourceMap& map, const std::string& grammar){
    SourceLocation at;
    if(!e.positions().empty()) at = map.locate(e.positions().front().byte);
    throw syntax_error(make_error(codes::syntax, "Invalid arguments: " + parse_error_message(e), at, "grammar " + grammar));
}

} // namespace fee
