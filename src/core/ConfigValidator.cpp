#include "ConfigValidator.h"
#include "Logging.h"

namespace secscrub {

bool ConfigValidator::clamp(int& value, int lo, int hi, int fallback, const char* field){
    if(value >= lo && value <= hi) return true;
    Logger::instance().warn(std::string("config: invalid ") + field + " " + std::to_string(value) +
                            ", using default " + std::to_string(fallback));
    value = fallback;
    return false;
}

bool ConfigValidator::normalize(ErrorSanitizationConfig& cfg){
    bool ok = true;
    ok &= clamp(cfg.max_stack_depth, 1, 1000, DEFAULT_MAX_STACK_DEPTH, "max_stack_depth");
    ok &= clamp(cfg.max_message_length, 10, 100000, DEFAULT_MAX_MESSAGE_LENGTH, "max_message_length");
    return ok;
}

bool ConfigValidator::normalize(ErrorContextConfig& cfg){
    bool ok = true;
    ok &= clamp(cfg.max_context_length, 10, 1000000, DEFAULT_MAX_CONTEXT_LENGTH, "max_context_length");
    ok &= clamp(cfg.max_forwarding_size, 256, 1000000, DEFAULT_MAX_FORWARDING_SIZE, "max_forwarding_size");
    return ok;
}

std::vector<std::regex> ConfigValidator::compile_patterns(const std::vector<std::string>& sources,
                                                          std::vector<PatternWarning>& warnings){
    std::vector<std::regex> out;
    for(const auto& src : sources){
        if(src.empty()) continue;
        if(src.size() > MAX_REGEX_LENGTH){
            warnings.push_back({"regex_too_long", src.substr(0, 64), std::to_string(src.size()) + " chars"});
            Logger::instance().warn("config: custom pattern rejected (regex_too_long)");
            continue;
        }
        try {
            out.emplace_back(src, std::regex::ECMAScript | std::regex::icase);
        } catch(const std::regex_error& e){
            warnings.push_back({"bad_regex", src, e.what()});
            Logger::instance().warn(std::string("config: custom pattern rejected (bad_regex): ") + e.what());
        }
    }
    return out;
}

}
