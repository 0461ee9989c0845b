#pragma once
#include "../core/Severity.h"
#include <string>
#include <vector>

namespace secscrub {

constexpr size_t MAX_INPUT_LENGTH = 10240;
constexpr int MAX_RISK_SCORE = 100;

struct SecurityViolation {
    std::string type;
    std::string pattern;
    Severity severity = Severity::Low;
    std::string description;
    std::string recommendation;
};

struct SecurityAnalysisResult {
    bool is_secure = true;
    std::vector<SecurityViolation> violations;
    int risk_score = 0; // 0..100, clamped sum of violation weights
    std::string sanitized_input;

    bool has_violation(const std::string& type) const;
};

// Scores the input against every threat check in the catalog. Inputs longer than
// MAX_INPUT_LENGTH are analyzed on their prefix and flagged as oversized.
SecurityAnalysisResult analyze_input_security(const std::string& input);
// nullptr yields a secure, zero-risk result
SecurityAnalysisResult analyze_input_security(const char* input);

}
