#include "compose/directive.hpp"
#include "compose/error.hpp"
#include "pegtl/directive_grammar.hpp"
#include <tao/pegtl.hpp>

namespace compose {

namespace grammar = pegtl_front::directive;

namespace {

std::string_view trim_end(std::string_view s){
    auto last = s.find_last_not_of(" \t\r\n\v\f");
    return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
}

void parse_property(std::string_view token, PropertySet& out){
    grammar::state st;
    tao::pegtl::memory_input in(token.data(), token.size(), "property");
    if(!tao::pegtl::parse< grammar::property, grammar::action >(in, st) || !st.property)
        throw error("unknown property: " + std::string(token));
    out.insert(*st.property);
}

// `inner` is the text between '(' and the closing ')'.
void parse_property_list(std::string_view inner, PropertySet& out){
    if(inner.find_first_not_of(" \t") == std::string_view::npos) return; // "()"
    size_t start = 0;
    while(true){
        auto comma = inner.find(',', start);
        parse_property(inner.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start), out);
        if(comma == std::string_view::npos) break;
        start = comma + 1;
    }
}

} // namespace

std::optional<Directive> parse_directive(std::string_view line){
    auto opener = line.find(kCommentOpener);
    if(opener == std::string_view::npos) return std::nullopt;
    auto comment = line.substr(opener);
    auto prefix = comment.find(kControlPrefix);
    if(prefix == std::string_view::npos) return std::nullopt;
    auto cmd = comment.substr(prefix + kControlPrefix.size());

    grammar::state st;
    tao::pegtl::memory_input in(cmd.data(), cmd.size(), "directive");
    if(!tao::pegtl::parse< grammar::command, grammar::action >(in, st) || !st.kind)
        throw error("unknown compose command: " + std::string(cmd));

    Directive d{*st.kind, {}};
    auto paren = cmd.find('(');
    if(paren != std::string_view::npos){
        auto trimmed = trim_end(cmd);
        if(trimmed.empty() || trimmed.back() != ')') throw error("unclosed '('");
        parse_property_list(trimmed.substr(paren + 1, trimmed.size() - paren - 2), d.properties);
    }
    return d;
}

const char* to_string(DirectiveKind k){
    switch(k){
        case DirectiveKind::Private: return "private";
        case DirectiveKind::BeginPrivate: return "begin_private";
        case DirectiveKind::EndPrivate: return "end_private";
    }
    return "?";
}

} // namespace compose
