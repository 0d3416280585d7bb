// .compose.edn grammar: one EDN map from keywords to vectors of strings or symbols.
#pragma once
#include "compose/config.hpp"
#include <set>
#include <string>
#include <tao/pegtl.hpp>

namespace compose::pegtl_front::config {
using namespace tao::pegtl;

// EDN whitespace: commas count as whitespace, ';' starts a line comment.
struct comment_line : seq< one<';'>, until< eolf > > {};
struct space_or_comment : sor< space, one<','>, comment_line > {};
struct skip : star< space_or_comment > {};

struct sym_first : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','.'> > {};
struct sym_rest : sor< alnum, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','.','#',':','\''> > {};
struct edn_symbol : seq< sym_first, star< sym_rest > > {};
struct edn_keyword : seq< one<':'>, edn_symbol > {};

struct escaped : seq< one<'\\'>, one<'"','\\','n','t','r'> > {};
struct string_char : sor< escaped, not_one<'"','\\','\n'> > {};
struct string_body : star< string_char > {};
struct string_close : one<'"'> {};
struct string_lit : seq< one<'"'>, string_body, must< string_close > > {};

struct bare_name : edn_symbol {};
struct name : sor< string_lit, bare_name > {};
struct vector_close : one<']'> {};
struct vector_lit : seq< one<'['>, skip, star< name, skip >, must< vector_close > > {};

struct map_value : vector_lit {};
struct map_entry : seq< edn_keyword, skip, must< map_value > > {};
struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct trailing : eof {};
struct document : seq< skip, must< map_open >, skip, star< map_entry, skip >, must< map_close >, skip, must< trailing > > {};

template<typename> inline constexpr const char* error_message = "invalid syntax";
template<> inline constexpr const char* error_message< string_close > = "unterminated string";
template<> inline constexpr const char* error_message< vector_close > = "expected a string, a symbol or ']'";
template<> inline constexpr const char* error_message< map_value > = "expected a vector of names after the key";
template<> inline constexpr const char* error_message< map_open > = "expected '{' opening the config map";
template<> inline constexpr const char* error_message< map_close > = "expected a keyword or '}'";
template<> inline constexpr const char* error_message< trailing > = "trailing content after the config map";

template<typename Rule>
struct control : normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...){
        throw parse_error(error_message<Rule>, in);
    }
};

struct state {
    Config cfg;
    std::vector<std::filesystem::path>* current = nullptr;
    std::set<std::string> seen;
};

inline std::string unescape(const std::string& raw){
    std::string out; out.reserve(raw.size());
    for(size_t i = 0; i < raw.size(); ++i){
        char c = raw[i];
        if(c == '\\' && i + 1 < raw.size()){
            char e = raw[++i];
            switch(e){ case 'n': c = '\n'; break; case 't': c = '\t'; break; case 'r': c = '\r'; break; default: c = e; break; }
        }
        out += c;
    }
    return out;
}

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< edn_keyword > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, state& st){
        const auto key = in.string();
        if(!st.seen.insert(key).second) throw parse_error("duplicate key " + key, in.position());
        if(key == ":entries") st.current = &st.cfg.entries;
        else if(key == ":no-copy") st.current = &st.cfg.no_copy;
        else if(key == ":no-remove") st.current = &st.cfg.no_remove;
        else if(key == ":workspace-tools") st.current = &st.cfg.workspace_tools;
        else throw parse_error("unknown key " + key, in.position());
    }
};

template<> struct action< string_body > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.current->emplace_back(unescape(in.string())); }
};

template<> struct action< bare_name > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.current->emplace_back(in.string()); }
};

} // namespace compose::pegtl_front::config
