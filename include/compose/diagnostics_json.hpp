// diagnostics_json.hpp - JSON serialization of a compose::error chain
#pragma once
#include "compose/error.hpp"
#include <string>

namespace compose {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"message":<outermost>,"causes":[<next>,...,<root>],"line":N}
std::string error_to_json(const error& e);

// If COMPOSE_DIAG_JSON=1 in the environment, print the error JSON to stderr.
void maybe_print_json(const error& e);

} // namespace compose
