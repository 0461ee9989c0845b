#include "InputThreatAnalyzer.h"
#include "InputSanitizer.h"
#include "../core/PatternCatalog.h"
#include "../core/Utils.h"
#include <algorithm>

namespace secscrub {

bool SecurityAnalysisResult::has_violation(const std::string& type) const {
    return std::any_of(violations.begin(), violations.end(), [&](const SecurityViolation& v){ return v.type == type; });
}

static bool check_matches(const PatternCatalog& catalog, const ThreatCheck& check, const std::string& s){
    for(const std::regex* re : check.rules){
        if(std::regex_search(s, *re)) return true;
    }
    for(CodepointClass c : check.codepoints){
        if(catalog.has_codepoint(s, c)) return true;
    }
    return check.lookalike_traversal && catalog.has_lookalike_traversal(s);
}

SecurityAnalysisResult analyze_input_security(const std::string& input){
    SecurityAnalysisResult res;
    const PatternCatalog& catalog = pattern_catalog();
    int score = 0;

    std::string window = input;
    if(input.size() > MAX_INPUT_LENGTH){
        window = utils::utf8_prefix(input, MAX_INPUT_LENGTH);
        res.violations.push_back({"input-validation", "oversized-input", Severity::Medium,
                                  "Input exceeds " + std::to_string(MAX_INPUT_LENGTH) + " bytes",
                                  "Reject or truncate oversized input"});
        score += 20;
    }

    for(const auto& check : catalog.threat_checks()){
        if(!check_matches(catalog, check, window)) continue;
        res.violations.push_back({check.type, check.pattern, check.severity, check.description, check.recommendation});
        score += check.weight;
    }

    res.risk_score = std::min(score, MAX_RISK_SCORE);
    res.is_secure = res.violations.empty();
    res.sanitized_input = res.is_secure ? input : sanitize_input(input);
    return res;
}

SecurityAnalysisResult analyze_input_security(const char* input){
    if(!input) return SecurityAnalysisResult{};
    return analyze_input_security(std::string(input));
}

}
