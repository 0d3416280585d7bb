// compose.hpp - public tree generation: config -> copy/redact -> prune -> manifest
#pragma once
#include "compose/config.hpp"
#include "compose/directive.hpp"
#include "compose/error.hpp"
#include "compose/manifest.hpp"
#include "compose/redact.hpp"
#include "compose/sync.hpp"
#include <filesystem>
#include <vector>

namespace compose {

struct Options {
    std::filesystem::path in_path;   // private tree, holds .compose.edn
    std::filesystem::path out_path;  // public tree
    bool no_process = false;         // skip copy/redaction, only prune and write the manifest
    std::vector<std::filesystem::path> spare;      // extra top-level names kept by pruning
    std::vector<std::filesystem::path> add_tools;  // extra workspace tool members
};

// One full run. Throws compose::error with the failing step as outermost context.
void run(const Options& opts);

} // namespace compose
