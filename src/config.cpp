#include "compose/config.hpp"
#include "compose/error.hpp"
#include "compose/log.hpp"
#include "pegtl/config_grammar.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include <tao/pegtl.hpp>
#include <yaml-cpp/yaml.h>

namespace compose {

namespace grammar = pegtl_front::config;

namespace {

std::string at(const std::string& source, const YAML::Mark& m){
    return source + ":" + std::to_string(m.line + 1) + ":" + std::to_string(m.column + 1) + ": ";
}

void read_names(const YAML::Node& value, const std::string& key, const std::string& source,
                std::vector<std::filesystem::path>& out){
    if(value.IsNull()) return; // "no_copy:" with nothing after it
    if(!value.IsSequence())
        throw error(at(source, value.Mark()) + "expected a list of names for " + key, value.Mark().line + 1);
    for(const auto& item : value){
        if(!item.IsScalar())
            throw error(at(source, item.Mark()) + "expected a name in " + key, item.Mark().line + 1);
        out.emplace_back(item.Scalar());
    }
}

} // namespace

Config parse_config_yaml(std::string_view text, const std::string& source){
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch(const YAML::Exception& e){
        throw error(at(source, e.mark) + e.msg, e.mark.line + 1);
    }
    if(!root.IsMap()) throw error(source + ": expected a mapping of config keys");

    Config cfg;
    std::set<std::string> seen;
    for(const auto& kv : root){
        const auto& key_node = kv.first;
        const int line = key_node.Mark().line + 1;
        if(!key_node.IsScalar()) throw error(at(source, key_node.Mark()) + "expected a key", line);
        const auto key = key_node.Scalar();
        if(!seen.insert(key).second) throw error(at(source, key_node.Mark()) + "duplicate key " + key, line);
        std::vector<std::filesystem::path>* field = nullptr;
        if(key == "entries") field = &cfg.entries;
        else if(key == "no_copy") field = &cfg.no_copy;
        else if(key == "no_remove") field = &cfg.no_remove;
        else if(key == "workspace_tools") field = &cfg.workspace_tools;
        else throw error(at(source, key_node.Mark()) + "unknown key " + key, line);
        read_names(kv.second, key, source, *field);
    }
    if(!seen.count("entries")) throw error(source + ": missing required key entries");
    return cfg;
}

Config parse_config_edn(std::string_view text, const std::string& source){
    tao::pegtl::memory_input in(text.data(), text.size(), source);
    grammar::state st;
    try {
        if(!tao::pegtl::parse< grammar::document, grammar::action, grammar::control >(in, st))
            throw error(source + ": invalid config");
    } catch(const tao::pegtl::parse_error& e){
        const auto& positions = e.positions();
        throw error(e.what(), positions.empty() ? -1 : static_cast<int>(positions.front().line));
    }
    if(!st.seen.count(":entries")) throw error(source + ": missing required key :entries");
    return std::move(st.cfg);
}

Config load_config(const std::filesystem::path& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw error("failed to open " + path.string());
    std::ostringstream oss; oss << ifs.rdbuf();
    const bool edn = path.extension() == ".edn";
    auto cfg = with_context("failed to parse config", [&]{
        return edn ? parse_config_edn(oss.str(), path.string()) : parse_config_yaml(oss.str(), path.string());
    });
    debug_log("config", path.string() + ": " + std::to_string(cfg.entries.size()) + " entries, "
        + std::to_string(cfg.no_copy.size()) + " excluded names, " + std::to_string(cfg.no_remove.size()) + " kept names, "
        + std::to_string(cfg.workspace_tools.size()) + " tools");
    return cfg;
}

std::filesystem::path find_config(const std::filesystem::path& in_root){
    const auto yml = in_root / kConfigName;
    const auto edn = in_root / kEdnConfigName;
    std::error_code ec;
    if(!std::filesystem::exists(yml, ec) && std::filesystem::exists(edn, ec)) return edn;
    return yml;
}

} // namespace compose
