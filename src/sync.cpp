// Tree synchronizer: depth-first mirror of the private tree plus top-level pruning.
#include "compose/sync.hpp"
#include "compose/error.hpp"
#include "compose/log.hpp"
#include "compose/redact.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace compose {

namespace {

std::string display(const fs::path& p){ return p.string(); }

std::string read_file(const fs::path& p){
    std::ifstream ifs(p, std::ios::binary);
    if(!ifs) throw error("failed to read file " + display(p));
    std::ostringstream oss; oss << ifs.rdbuf();
    if(ifs.bad()) throw error("failed to read file " + display(p));
    return oss.str();
}

void write_file(const fs::path& p, const std::string& content){
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    if(!ofs) throw error("failed to write file " + display(p));
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.close();
    if(!ofs) throw error("failed to write file " + display(p));
}

void create_parent_dirs(const fs::path& out){
    auto dir = out.parent_path();
    if(dir.empty()) return;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec) throw error("failed to create dir " + display(dir) + ": " + ec.message());
}

bool is_dir_checked(const fs::path& p){
    std::error_code ec;
    bool dir = fs::is_directory(p, ec); // follows symlinks
    if(ec && ec != std::errc::no_such_file_or_directory)
        throw error("failed to stat " + display(p) + ": " + ec.message());
    return dir;
}

// Names of the entries of `dir`, sorted.
std::vector<fs::path> list_dir(const fs::path& dir){
    std::vector<fs::path> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if(ec) throw error("failed to read dir " + display(dir) + ": " + ec.message());
    for(; it != end; it.increment(ec)){
        if(ec) break;
        names.push_back(it->path().filename());
    }
    if(ec) throw error("failed to read entry in dir " + display(dir) + ": " + ec.message());
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

bool is_source_file(const fs::path& p){
    const auto name = p.filename().string();
    const std::string suffix = kSourceSuffix;
    return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void process_file(const fs::path& in, const fs::path& out){
    create_parent_dirs(out);
    if(is_source_file(in)){
        auto content = read_file(in);
        auto redacted = with_context("failed to process file " + display(in), [&]{ return redact_source(content); });
        write_file(out, redacted);
        debug_log("sync", "redacted " + display(in) + " -> " + display(out));
    } else {
        std::error_code ec;
        fs::copy_file(in, out, fs::copy_options::overwrite_existing, ec);
        if(ec) throw error("failed to copy " + display(in) + " to " + display(out) + ": " + ec.message());
        debug_log("sync", "copied " + display(in) + " -> " + display(out));
    }
}

void process_dir(const fs::path& in, const fs::path& out, const NameSet& excluded){
    for(const auto& name : list_dir(in)){
        if(excluded.count(name)){
            debug_log("sync", "skipped " + display(in / name));
            continue;
        }
        const auto next_in = in / name;
        const auto next_out = out / name;
        if(is_dir_checked(next_in)) process_dir(next_in, next_out, excluded);
        else process_file(next_in, next_out);
    }
}

void process_entries(const fs::path& in_root, const fs::path& out_root, const Config& config){
    const NameSet excluded(config.no_copy.begin(), config.no_copy.end());
    for(const auto& entry : config.entries){
        const auto name = normalize_name(entry);
        const auto in = in_root / name;
        const auto out = out_root / name;
        if(is_dir_checked(in)) process_dir(in, out, excluded);
        else process_file(in, out);
    }
}

fs::path normalize_name(const fs::path& p){
    auto n = p.lexically_normal();
    if(!n.has_filename() && n.has_parent_path()) n = n.parent_path(); // "hello/" -> "hello"
    return n;
}

NameSet make_spare_set(const Config& config, const std::vector<fs::path>& extra){
    NameSet spare;
    for(const auto& list : {&config.entries, &config.no_remove, &extra})
        for(const auto& name : *list) spare.insert(normalize_name(name));
    return spare;
}

std::vector<fs::path> prune_entries(const fs::path& out_root, const NameSet& spare){
    std::vector<fs::path> removed;
    for(const auto& name : list_dir(out_root)){
        if(spare.count(name)) continue;
        const auto path = out_root / name;
        std::error_code ec;
        fs::remove_all(path, ec); // does not follow symlinks
        if(ec) throw error("failed to remove " + display(path) + ": " + ec.message());
        debug_log("prune", "removed " + display(path));
        removed.push_back(name);
    }
    return removed;
}

} // namespace compose
