// Directive grammar: the command keyword after `compose::` and a single property token.
#pragma once
#include "compose/directive.hpp"
#include <optional>
#include <tao/pegtl.hpp>

namespace compose::pegtl_front::directive {
using namespace tao::pegtl;

struct kw_begin_private : TAO_PEGTL_STRING("begin_private") {};
struct kw_end_private : TAO_PEGTL_STRING("end_private") {};
struct kw_private : TAO_PEGTL_STRING("private") {};
// Prefix match only: whatever follows the keyword is left in the input.
struct command : sor< kw_begin_private, kw_end_private, kw_private > {};

struct prop_no_hint : TAO_PEGTL_STRING("no_hint") {};
struct prop_unimplemented : TAO_PEGTL_STRING("unimplemented") {};
// One comma-separated token of a property list, blanks around it allowed.
struct property : seq< star< blank >, sor< prop_no_hint, prop_unimplemented >, star< blank >, eof > {};

struct state {
    std::optional<DirectiveKind> kind;
    std::optional<DirectiveProperty> property;
};

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< kw_begin_private > {
    static void apply0(state& st){ st.kind = DirectiveKind::BeginPrivate; }
};
template<> struct action< kw_end_private > {
    static void apply0(state& st){ st.kind = DirectiveKind::EndPrivate; }
};
template<> struct action< kw_private > {
    static void apply0(state& st){ st.kind = DirectiveKind::Private; }
};
template<> struct action< prop_no_hint > {
    static void apply0(state& st){ st.property = DirectiveProperty::NoHint; }
};
template<> struct action< prop_unimplemented > {
    static void apply0(state& st){ st.property = DirectiveProperty::Unimplemented; }
};

} // namespace compose::pegtl_front::directive
