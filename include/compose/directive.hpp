// directive.hpp - decoding of `// compose::...` directives found in source lines
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace compose {

enum class DirectiveKind { Private, BeginPrivate, EndPrivate };

enum class DirectiveProperty : std::uint8_t { NoHint = 1u << 0, Unimplemented = 1u << 1 };

// Small closed flag set over DirectiveProperty.
class PropertySet {
public:
    PropertySet() = default;
    void insert(DirectiveProperty p){ bits_ |= static_cast<std::uint8_t>(p); }
    bool contains(DirectiveProperty p) const { return (bits_ & static_cast<std::uint8_t>(p)) != 0; }
    bool empty() const { return bits_ == 0; }
    bool operator==(const PropertySet& o) const { return bits_ == o.bits_; }
    bool operator!=(const PropertySet& o) const { return bits_ != o.bits_; }
private:
    std::uint8_t bits_{0};
};

struct Directive {
    DirectiveKind kind;
    PropertySet properties;
};

inline constexpr std::string_view kCommentOpener = "//";
inline constexpr std::string_view kControlPrefix = "compose::";

// Decode the directive carried by `line`, if any.
//  - std::nullopt when the line has no `//` or no `compose::` after it;
//  - throws compose::error for an unknown command, an unclosed '(' or an unknown property.
// Keywords match by prefix (`compose::privateX` is a Private directive); text between the
// keyword and an optional '(' is ignored.
std::optional<Directive> parse_directive(std::string_view line);

const char* to_string(DirectiveKind k);

} // namespace compose
