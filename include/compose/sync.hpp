// sync.hpp - mirroring the private tree into the public one
#pragma once
#include "compose/config.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace compose {

namespace fs = std::filesystem;

// Files redacted instead of copied verbatim.
inline constexpr const char* kSourceSuffix = ".rs";

// Bare entry names (no paths). Excluded names are skipped at every depth.
using NameSet = std::set<fs::path>;

bool is_source_file(const fs::path& p);

// Copy one file, redacting it first when it is a source file. Parent directories of `out` are
// created as needed.
void process_file(const fs::path& in, const fs::path& out);

// Recursively mirror `in` into `out`, skipping every entry whose name is in `excluded`.
// Entries are visited in name order; output directories appear only once a file lands in them.
void process_dir(const fs::path& in, const fs::path& out, const NameSet& excluded);

// Mirror each configured entry of `in_root` into `out_root`, with config.no_copy as exclusions.
void process_entries(const fs::path& in_root, const fs::path& out_root, const Config& config);

// Lexically normal form without a trailing separator: "hello/" and "./hello" become "hello".
fs::path normalize_name(const fs::path& p);

// entries + no_remove + extra, normalized
NameSet make_spare_set(const Config& config, const std::vector<fs::path>& extra);

// Remove top-level entries of `out_root` not named in `spare`. Kept directories are not
// inspected. Returns the names removed.
std::vector<fs::path> prune_entries(const fs::path& out_root, const NameSet& spare);

} // namespace compose
