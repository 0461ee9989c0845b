#pragma once
#include <string>
#include <vector>
#include "Severity.h"

namespace secscrub {

constexpr size_t MAX_LOG_LINE = 2000;

// Neutralizes log forging: ANSI escapes, control characters, CR/LF, bidi overrides,
// printf-style specifiers and whitespace floods.
std::string sanitize_log_output(const std::string& text);

struct LogSecurityReport {
    Severity risk_level = Severity::Low;
    std::vector<std::string> issues;
    bool has_ansi = false;
    bool has_control_chars = false;
    bool has_line_injection = false;
    bool has_format_specifiers = false;
};

LogSecurityReport analyze_log_security(const std::string& text);

}
