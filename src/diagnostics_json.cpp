#include "compose/diagnostics_json.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace compose {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string error_to_json(const error& e){
    const auto chain = e.chain();
    std::ostringstream os;
    os<<"{\"message\":"<<json_escape(chain.front())<<",\"causes\":[";
    for(size_t i=1;i<chain.size(); ++i){
        if(i>1) os<<",";
        os<<json_escape(chain[i]);
    }
    os<<"],\"line\":"<<e.line()<<"}";
    return os.str();
}

void maybe_print_json(const error& e){
    if(const char* env = std::getenv("COMPOSE_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=error_to_json(e);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace compose
