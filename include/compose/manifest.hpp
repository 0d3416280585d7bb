// manifest.hpp - workspace Cargo.toml at the root of the public tree
#pragma once
#include "compose/config.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace compose {

inline constexpr const char* kPackageDescriptor = "Cargo.toml";

// Render the [workspace] table with a "Tasks" and a "Tools" section of members.
std::string render_workspace_manifest(const std::vector<std::string>& tasks, const std::vector<std::string>& tools);

// Configured entries that became packages in `out_root` (they hold a Cargo.toml), in config order.
std::vector<std::string> collect_tasks(const std::filesystem::path& out_root, const Config& config);

// Write <out_root>/Cargo.toml. Tools are config.workspace_tools followed by `extra_tools`.
void write_workspace_manifest(const std::filesystem::path& out_root, const Config& config,
                              const std::vector<std::filesystem::path>& extra_tools);

} // namespace compose
