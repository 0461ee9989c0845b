#pragma once
#include "ContextRedactor.h"
#include "../core/Config.h"
#include "../core/ContextValue.h"
#include "../core/Severity.h"
#include <string>
#include <vector>

namespace secscrub {

constexpr size_t AUDIT_MAX_STACK_CHARS = 10000;
constexpr size_t AUDIT_MAX_STACK_LINES = 100;
constexpr size_t AUDIT_MAX_LINE_LENGTH = 500;

struct StackFinding {
    std::string category; // home-directory, source-maps, sensitive-names, internal-structure, deployment-paths, long-paths
    Severity severity = Severity::Medium;
    size_t line = 0; // 1-based
    std::string match;
};

struct StackTraceSecurityReport {
    Severity risk_level = Severity::Low;
    std::vector<std::string> risks; // distinct categories, first-seen order
    std::vector<StackFinding> findings;
    std::vector<std::string> recommendations;
    bool truncated = false;
};

struct ContextSecurityReport {
    Severity risk_level = Severity::Low;
    std::vector<SensitiveContextDetection> detections;
    std::vector<std::string> recommendations;
    int estimated_redaction_percentage = 0;
    std::vector<std::string> warnings;
};

// Read-only; neither function mutates its input.
StackTraceSecurityReport analyze_stack_trace_security(const std::string& stack);
ContextSecurityReport analyze_error_context_security(const ContextValue& context, const ErrorContextConfig& config = {});

}
