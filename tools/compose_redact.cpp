// compose_redact: redact a single file, for inspection or golden comparison.
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "compose/diagnostics_json.hpp"
#include "compose/redact.hpp"

using namespace compose;

static int usage(){
    std::cerr << "usage: compose_redact (print|test) <input.rs> [golden]\n";
    return 2;
}

static std::string read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw error("failed to open: " + path);
    std::ostringstream oss; oss << ifs.rdbuf();
    return oss.str();
}

// 1-based number of the first differing line, 0 when equal.
static size_t first_difference(const std::string& a, const std::string& b){
    auto la = split_lines(a), lb = split_lines(b);
    for(size_t i=0;i<la.size() || i<lb.size();++i){
        if(i>=la.size() || i>=lb.size() || la[i]!=lb[i]) return i+1;
    }
    return a==b ? 0 : la.size()+1;
}

int main(int argc, char** argv){
    if(argc<3) return usage();
    const std::string mode = argv[1];
    if(mode!="print" && mode!="test") return usage();
    if(mode=="test" && argc<4) return usage();
    try {
        const std::string input = argv[2];
        auto out = with_context("failed to process file " + input, [&]{ return redact_source(read_file(input)); });
        if(mode=="print"){ std::cout << out; return 0; }
        auto gold = read_file(argv[3]);
        if(auto line = first_difference(out, gold)){
            std::cerr << input << ": output differs from " << argv[3] << " at line " << line << "\n";
            return 1;
        }
        return 0;
    } catch(const error& e){
        std::cerr << "Error: " << format_error(e) << "\n";
        maybe_print_json(e);
        return 1;
    }
}
