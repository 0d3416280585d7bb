// redact.hpp - private region resolution over the lines of one source file
#pragma once
#include "compose/directive.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace compose {

// Placeholder lines emitted for a hinted region (indentation of the directive line is prepended).
inline constexpr std::string_view kHintLine = "// TODO: your code here.";
inline constexpr std::string_view kUnimplementedLine = "unimplemented!()";

// Half-open range of lines [begin, end) hidden from the output.
struct PrivateRegion {
    size_t begin;
    size_t end;
    PropertySet properties;
};

// Split text into lines: '\n' separated, a trailing '\r' dropped, no empty line after a final newline.
std::vector<std::string> split_lines(std::string_view text);

// First line at or after `start` carrying a directive. Parse failures are reported with the
// 1-based line number.
std::optional<std::pair<size_t, Directive>> find_directive(const std::vector<std::string>& lines, size_t start);

// Region opened by `d` found on line `begin`. Throws for an unpaired end, a nested begin or an
// unclosed begin.
PrivateRegion resolve_region(const std::vector<std::string>& lines, size_t begin, const Directive& d);

// Transform one file's lines. Directive-free input comes back unchanged.
std::vector<std::string> redact_lines(const std::vector<std::string>& lines);

// split_lines + redact_lines, every output line '\n' terminated.
std::string redact_source(std::string_view src);

} // namespace compose
