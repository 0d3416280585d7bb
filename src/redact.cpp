// Redaction engine: a cursor walks the file, copying plain spans and replacing each private
// region by nothing or by placeholder lines. States are "outside" (looking for the next
// directive) and "inside" (looking for the end_private of an open block).
#include "compose/redact.hpp"
#include "compose/error.hpp"
#include "compose/log.hpp"
#include <algorithm>

namespace compose {

namespace {

bool is_blank(const std::string& s){
    return s.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

std::string indentation_of(const std::string& s){
    auto n = s.find_first_not_of(" \t\v\f");
    return n == std::string::npos ? s : s.substr(0, n);
}

} // namespace

std::vector<std::string> split_lines(std::string_view text){
    std::vector<std::string> lines;
    size_t pos = 0;
    while(pos < text.size()){
        auto nl = text.find('\n', pos);
        auto len = (nl == std::string_view::npos ? text.size() : nl) - pos;
        auto line = text.substr(pos, len);
        if(!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        if(nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

std::optional<std::pair<size_t, Directive>> find_directive(const std::vector<std::string>& lines, size_t start){
    for(size_t i = start; i < lines.size(); ++i){
        const int line_no = static_cast<int>(i + 1);
        auto d = with_context("failed to parse directive on line " + std::to_string(line_no), [&]{
            try {
                return parse_directive(lines[i]);
            } catch(error& e){
                e.set_line(line_no);
                throw;
            }
        });
        if(d) return std::make_pair(i, *d);
    }
    return std::nullopt;
}

PrivateRegion resolve_region(const std::vector<std::string>& lines, size_t begin, const Directive& d){
    switch(d.kind){
        case DirectiveKind::EndPrivate:
            throw error("unpaired 'end_private' on line " + std::to_string(begin + 1), static_cast<int>(begin + 1));
        case DirectiveKind::Private:
            return PrivateRegion{begin, begin + 1, d.properties};
        case DirectiveKind::BeginPrivate:
            break;
    }
    size_t pos = begin + 1;
    while(auto next = find_directive(lines, pos)){
        const size_t k = next->first;
        switch(next->second.kind){
            case DirectiveKind::BeginPrivate:
                throw error("nested 'begin_private' on line " + std::to_string(k + 1), static_cast<int>(k + 1));
            case DirectiveKind::Private:
                pos = k + 1; // plain content inside the block
                break;
            case DirectiveKind::EndPrivate:
                return PrivateRegion{begin, k + 1, d.properties};
        }
    }
    throw error("unclosed 'begin_private' on line " + std::to_string(begin + 1), static_cast<int>(begin + 1));
}

std::vector<std::string> redact_lines(const std::vector<std::string>& lines){
    std::vector<std::string> out;
    out.reserve(lines.size());
    size_t cursor = 0;
    while(auto found = find_directive(lines, cursor)){
        const auto region = resolve_region(lines, found->first, found->second);
        if(debug_enabled())
            debug_log("redact", std::string(to_string(found->second.kind)) + " lines " + std::to_string(region.begin + 1) + ".." + std::to_string(region.end));

        out.insert(out.end(), lines.begin() + cursor, lines.begin() + region.begin);

        if(region.properties.contains(DirectiveProperty::NoHint)){
            // Swallow one of the two blank lines that would otherwise surround the gap.
            const bool blank_before = region.begin > 0 && is_blank(lines[region.begin - 1]);
            const bool blank_after = region.end < lines.size() && is_blank(lines[region.end]);
            cursor = (blank_before && blank_after) ? region.end + 1 : region.end;
        } else {
            const auto indent = indentation_of(lines[region.begin]);
            out.push_back(indent + std::string(kHintLine));
            if(region.properties.contains(DirectiveProperty::Unimplemented))
                out.push_back(indent + std::string(kUnimplementedLine));
            cursor = region.end;
        }
    }
    out.insert(out.end(), lines.begin() + std::min(cursor, lines.size()), lines.end());
    return out;
}

std::string redact_source(std::string_view src){
    std::string dst;
    dst.reserve(src.size());
    for(const auto& line : redact_lines(split_lines(src))){
        dst += line;
        dst += '\n';
    }
    return dst;
}

} // namespace compose
