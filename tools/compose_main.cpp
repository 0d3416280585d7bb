// compose: build the public skeleton tree from the private one.
#include <cstring>
#include <iostream>
#include <string>
#include "compose/compose.hpp"
#include "compose/diagnostics_json.hpp"

using namespace compose;

static int usage(){
    std::cerr << "usage: compose -i <in-path> -o <out-path> [--no-process] [-s <name>]... [-t <path>]...\n"
                 "  -i, --in-path <path>    private repository (holds .compose.yml)\n"
                 "  -o, --out-path <path>   public repository\n"
                 "      --no-process        skip copying and redaction\n"
                 "  -s, --spare <name>      spare a top-level entry from pruning\n"
                 "  -t, --add-tool <path>   add a tool to the workspace Cargo.toml\n";
    return 2;
}

static bool is_opt(const char* arg, const char* short_name, const char* long_name){
    return (short_name && std::strcmp(arg, short_name)==0) || std::strcmp(arg, long_name)==0;
}

int main(int argc, char** argv){
    Options opts;
    bool have_in=false, have_out=false;
    for(int i=1;i<argc;++i){
        const char* a = argv[i];
        auto value = [&](const char* opt) -> const char* {
            if(i+1>=argc){ std::cerr << "missing value for " << opt << "\n"; return nullptr; }
            return argv[++i];
        };
        if(is_opt(a, "-h", "--help")){ usage(); return 0; }
        else if(is_opt(a, nullptr, "--no-process")) opts.no_process = true;
        else if(is_opt(a, "-i", "--in-path")){ auto v=value(a); if(!v) return usage(); opts.in_path=v; have_in=true; }
        else if(is_opt(a, "-o", "--out-path")){ auto v=value(a); if(!v) return usage(); opts.out_path=v; have_out=true; }
        else if(is_opt(a, "-s", "--spare")){ auto v=value(a); if(!v) return usage(); opts.spare.emplace_back(v); }
        else if(is_opt(a, "-t", "--add-tool")){ auto v=value(a); if(!v) return usage(); opts.add_tools.emplace_back(v); }
        else { std::cerr << "unknown argument: " << a << "\n"; return usage(); }
    }
    if(!have_in || !have_out) return usage();

    try {
        run(opts);
    } catch(const error& e){
        std::cerr << "Error: " << format_error(e) << "\n";
        auto chain = e.chain();
        for(size_t i=1;i<chain.size();++i) std::cerr << "  caused by: " << chain[i] << "\n";
        maybe_print_json(e);
        return 1;
    } catch(const std::exception& e){
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
