// log.hpp - stderr debug trace gated by COMPOSE_DEBUG=1
#pragma once
#include <cstdio>
#include <cstdlib>
#include <string>

namespace compose {

inline bool debug_enabled(){
    const char* env = std::getenv("COMPOSE_DEBUG");
    return env && env[0]=='1';
}

// "[compose][<tag>] <message>" on stderr when COMPOSE_DEBUG=1.
inline void debug_log(const char* tag, const std::string& message){
    if(debug_enabled()) std::fprintf(stderr, "[compose][%s] %s\n", tag, message.c_str());
}

} // namespace compose
