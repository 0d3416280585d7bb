// config.hpp - project configuration (.compose.yml, or .compose.edn)
#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace compose {

inline constexpr const char* kConfigName = ".compose.yml";
inline constexpr const char* kEdnConfigName = ".compose.edn";

// Declarative description of the public tree, read from the root of the private tree.
//
//   entries: [tools, hello-world]    # top-level entries to mirror (required)
//   no_copy: [target, .git]          # names skipped at any depth while copying
//   no_remove: [.git, README.md]     # top-level output names never pruned
//   workspace_tools: [tools/compose] # extra members of the tools section
//
// The EDN form uses the same keys as keywords with dashes:
//   {:entries ["tools"] :no-copy ["target"] :no-remove [".git"] :workspace-tools ["tools/compose"]}
struct Config {
    std::vector<std::filesystem::path> entries;
    std::vector<std::filesystem::path> no_copy;
    std::vector<std::filesystem::path> no_remove;
    std::vector<std::filesystem::path> workspace_tools;
};

// Parse YAML config text. `source` names the input in error messages. Throws compose::error on
// a syntax error (with line and column), a value that is not a list of names, an unknown or
// repeated key, or a missing `entries`.
Config parse_config_yaml(std::string_view text, const std::string& source = "<memory>");

// Same rules for the EDN form.
Config parse_config_edn(std::string_view text, const std::string& source = "<memory>");

// Read and parse a config file; `.edn` files use the EDN form, anything else YAML.
Config load_config(const std::filesystem::path& path);

// Config file of a private tree: .compose.yml, else .compose.edn when only that one exists.
std::filesystem::path find_config(const std::filesystem::path& in_root);

} // namespace compose
