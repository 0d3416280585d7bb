#include "compose/manifest.hpp"
#include "compose/error.hpp"
#include "compose/log.hpp"
#include "compose/sync.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace compose {

namespace {

void append_members(std::ostringstream& os, const std::vector<std::string>& members){
    for(const auto& m : members) os << "    \"" << m << "\",\n";
}

} // namespace

std::string render_workspace_manifest(const std::vector<std::string>& tasks, const std::vector<std::string>& tools){
    std::ostringstream os;
    os << "[workspace]\n"
       << "members = [\n"
       << "    # Tasks\n";
    append_members(os, tasks);
    os << "\n"
       << "    # Tools\n";
    append_members(os, tools);
    os << "]\n";
    return os.str();
}

std::vector<std::string> collect_tasks(const std::filesystem::path& out_root, const Config& config){
    std::vector<std::string> tasks;
    for(const auto& entry : config.entries){
        std::error_code ec;
        if(std::filesystem::exists(out_root / entry / kPackageDescriptor, ec))
            tasks.push_back(normalize_name(entry).generic_string());
        else if(ec)
            throw error("failed to stat " + (out_root / entry / kPackageDescriptor).string() + ": " + ec.message());
    }
    return tasks;
}

void write_workspace_manifest(const std::filesystem::path& out_root, const Config& config,
                              const std::vector<std::filesystem::path>& extra_tools){
    std::vector<std::string> tools;
    for(const auto& t : config.workspace_tools) tools.push_back(t.generic_string());
    for(const auto& t : extra_tools) tools.push_back(t.generic_string());

    const auto content = render_workspace_manifest(collect_tasks(out_root, config), tools);
    const auto path = out_root / kPackageDescriptor;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if(!ofs) throw error("failed to write " + path.string());
    ofs << content;
    ofs.close();
    if(!ofs) throw error("failed to write " + path.string());
    debug_log("manifest", "wrote " + path.string());
}

} // namespace compose
