#include "Severity.h"
#include "Utils.h"

namespace secscrub {

const char* severity_to_string(Severity s){
    switch(s){
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

int severity_rank(const std::string& sev){
    std::string s = utils::to_lower(sev);
    if(s == "low") return 0;
    if(s == "medium") return 1;
    if(s == "high") return 2;
    if(s == "critical") return 3;
    return -1;
}

bool parse_severity(const std::string& sev, Severity& out){
    int r = severity_rank(sev);
    if(r < 0) return false;
    out = static_cast<Severity>(r);
    return true;
}

}
