#pragma once
#include "../core/Config.h"
#include <string>

namespace secscrub {

constexpr size_t MAX_STACK_INPUT = 50000;
constexpr size_t STACK_CHUNK_THRESHOLD = 10000;
constexpr size_t STACK_CHUNK_SIZE = 5000;
constexpr size_t REPEATED_CHAR_RUN = 20;

// Multi-level stack redaction driven by config.stack_trace_level.
std::string sanitize_stack_trace(const std::string& stack, const ErrorSanitizationConfig& config = {});

// Ordered path sub-pipeline used by the sanitized level (control characters, node_modules,
// traversal, home, system, project, UNC/device, sensitive files, build dirs, repeats).
std::string sanitize_stack_paths(const std::string& text);

// Collapses runs of REPEATED_CHAR_RUN or more identical letters into a marker.
std::string collapse_repeated_chars(const std::string& text);

}
