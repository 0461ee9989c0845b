#pragma once
#include <string>
#include <vector>
#include <optional>

namespace secscrub {

enum class StackTraceLevel { None, Minimal, Sanitized, Full };
enum class RedactionLevel { None, Partial, Full };
enum class Environment { Development, Staging, Production };

const char* to_string(StackTraceLevel l);
const char* to_string(RedactionLevel l);
const char* to_string(Environment e);
bool parse_stack_trace_level(const std::string& s, StackTraceLevel& out);
bool parse_redaction_level(const std::string& s, RedactionLevel& out);
bool parse_environment(const std::string& s, Environment& out);

constexpr int DEFAULT_MAX_MESSAGE_LENGTH = 500;
constexpr int DEFAULT_MAX_STACK_DEPTH = 10;
constexpr int DEFAULT_MAX_CONTEXT_LENGTH = 1000;
constexpr int DEFAULT_MAX_FORWARDING_SIZE = 8000;

struct ErrorSanitizationConfig {
    bool redact_passwords = true;
    bool redact_api_keys = true;
    bool redact_file_paths = true;
    bool redact_database_urls = true;
    bool redact_network_info = true;
    bool redact_personal_info = true;
    std::vector<std::string> custom_patterns; // ECMAScript, matched case-insensitively, replaced by ***
    int max_message_length = DEFAULT_MAX_MESSAGE_LENGTH; // clamped to [10,100000]
    int max_stack_depth = DEFAULT_MAX_STACK_DEPTH; // clamped to [1,1000]
    bool remove_stack_in_production = true;
    bool preserve_error_codes = true;
    StackTraceLevel stack_trace_level = StackTraceLevel::Sanitized;
    bool remove_source_maps = true;
    bool sanitize_module_names = true;
    bool remove_line_numbers = false;
};

struct ErrorContextConfig {
    bool generate_secure_ids = true;
    bool preserve_error_codes = true;
    RedactionLevel redaction_level = RedactionLevel::Partial;
    bool include_context_hints = true;
    int max_context_length = DEFAULT_MAX_CONTEXT_LENGTH; // clamped to [10,1000000]
    std::vector<std::string> allowed_properties{"timestamp", "level", "operation", "component"}; // "*" allows all
    bool sanitize_nested_objects = true;
    bool preserve_timestamps = true;
    std::vector<std::string> custom_context_patterns;
    int max_forwarding_size = DEFAULT_MAX_FORWARDING_SIZE; // bytes, clamped to [256,1000000]
};

// Partial updates; unset fields keep the base value.
struct ErrorSanitizationOverrides {
    std::optional<bool> redact_passwords;
    std::optional<bool> redact_api_keys;
    std::optional<bool> redact_file_paths;
    std::optional<bool> redact_database_urls;
    std::optional<bool> redact_network_info;
    std::optional<bool> redact_personal_info;
    std::optional<std::vector<std::string>> custom_patterns;
    std::optional<int> max_message_length;
    std::optional<int> max_stack_depth;
    std::optional<bool> preserve_error_codes;
    std::optional<StackTraceLevel> stack_trace_level;
    std::optional<bool> remove_source_maps;
    std::optional<bool> sanitize_module_names;
    std::optional<bool> remove_line_numbers;
};

struct ErrorContextOverrides {
    std::optional<bool> generate_secure_ids;
    std::optional<bool> preserve_error_codes;
    std::optional<RedactionLevel> redaction_level;
    std::optional<bool> include_context_hints;
    std::optional<int> max_context_length;
    std::optional<std::vector<std::string>> allowed_properties;
    std::optional<bool> sanitize_nested_objects;
    std::optional<bool> preserve_timestamps;
    std::optional<std::vector<std::string>> custom_context_patterns;
    std::optional<int> max_forwarding_size;
};

// Applies overrides then clamps through ConfigValidator.
ErrorSanitizationConfig merge_config(ErrorSanitizationConfig base, const ErrorSanitizationOverrides& o);
ErrorContextConfig merge_config(ErrorContextConfig base, const ErrorContextOverrides& o);

// Environment / debug signals consumed by the detail gates.
struct RuntimeSignals {
    std::string environment; // lower-cased; empty when unset
    bool debug_flag = false; // SECSCRUB_DEBUG / DEBUG / CLI_DEBUG
    std::vector<std::string> args;

    static RuntimeSignals from_environment(int argc = 0, char** argv = nullptr);
};

// Snapshot of the process-wide signals; safe to call while another thread replaces them.
RuntimeSignals runtime_signals();
void set_runtime_signals(const RuntimeSignals& s);

}
