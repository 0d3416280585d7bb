#include "compose/error.hpp"

namespace compose {

std::string format_error(const error& e){
    std::string out;
    for(const auto& msg : e.chain()){
        if(!out.empty()) out += ": ";
        out += msg;
    }
    return out;
}

} // namespace compose
