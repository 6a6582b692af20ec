#include "XmlUtil.h"
#include <ctime>

namespace testsum {
namespace xmlutil {

std::string escape(const std::string& s){
    std::string out;
    out.reserve(s.size());
    for(char ch : s){
        unsigned char c = static_cast<unsigned char>(ch);
        switch(ch){
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                if(c < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
                out.push_back(ch);
        }
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

}
}
