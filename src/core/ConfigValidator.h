#pragma once
#include "Config.h"
#include <regex>
#include <string>
#include <vector>

namespace secscrub {

constexpr size_t MAX_REGEX_LENGTH = 512;

struct PatternWarning {
    std::string code; // bad_regex | regex_too_long
    std::string pattern;
    std::string detail;
};

class ConfigValidator {
public:
    // Clamp out-of-range values back to defaults. Returns true when nothing had to change.
    static bool normalize(ErrorSanitizationConfig& cfg);
    static bool normalize(ErrorContextConfig& cfg);

    // Compile caller-supplied patterns; rejected ones are skipped and reported.
    static std::vector<std::regex> compile_patterns(const std::vector<std::string>& sources,
                                                    std::vector<PatternWarning>& warnings);
private:
    static bool clamp(int& value, int lo, int hi, int fallback, const char* field);
};

}
