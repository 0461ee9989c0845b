#include "Config.h"
#include "ConfigValidator.h"
#include "Utils.h"
#include <cstdlib>
#include <mutex>

namespace secscrub {

const char* to_string(StackTraceLevel l){
    switch(l){
        case StackTraceLevel::None: return "none";
        case StackTraceLevel::Minimal: return "minimal";
        case StackTraceLevel::Sanitized: return "sanitized";
        case StackTraceLevel::Full: return "full";
    }
    return "sanitized";
}

const char* to_string(RedactionLevel l){
    switch(l){
        case RedactionLevel::None: return "none";
        case RedactionLevel::Partial: return "partial";
        case RedactionLevel::Full: return "full";
    }
    return "partial";
}

const char* to_string(Environment e){
    switch(e){
        case Environment::Development: return "development";
        case Environment::Staging: return "staging";
        case Environment::Production: return "production";
    }
    return "production";
}

bool parse_stack_trace_level(const std::string& s, StackTraceLevel& out){
    std::string v = utils::to_lower(s);
    if(v == "none") out = StackTraceLevel::None;
    else if(v == "minimal") out = StackTraceLevel::Minimal;
    else if(v == "sanitized") out = StackTraceLevel::Sanitized;
    else if(v == "full") out = StackTraceLevel::Full;
    else return false;
    return true;
}

bool parse_redaction_level(const std::string& s, RedactionLevel& out){
    std::string v = utils::to_lower(s);
    if(v == "none") out = RedactionLevel::None;
    else if(v == "partial") out = RedactionLevel::Partial;
    else if(v == "full") out = RedactionLevel::Full;
    else return false;
    return true;
}

bool parse_environment(const std::string& s, Environment& out){
    std::string v = utils::to_lower(s);
    if(v == "development" || v == "dev") out = Environment::Development;
    else if(v == "staging") out = Environment::Staging;
    else if(v == "production" || v == "prod") out = Environment::Production;
    else return false;
    return true;
}

template<typename T>
static void apply(T& field, const std::optional<T>& v){ if(v) field = *v; }

ErrorSanitizationConfig merge_config(ErrorSanitizationConfig base, const ErrorSanitizationOverrides& o){
    apply(base.redact_passwords, o.redact_passwords);
    apply(base.redact_api_keys, o.redact_api_keys);
    apply(base.redact_file_paths, o.redact_file_paths);
    apply(base.redact_database_urls, o.redact_database_urls);
    apply(base.redact_network_info, o.redact_network_info);
    apply(base.redact_personal_info, o.redact_personal_info);
    apply(base.custom_patterns, o.custom_patterns);
    apply(base.max_message_length, o.max_message_length);
    apply(base.max_stack_depth, o.max_stack_depth);
    apply(base.preserve_error_codes, o.preserve_error_codes);
    apply(base.stack_trace_level, o.stack_trace_level);
    apply(base.remove_source_maps, o.remove_source_maps);
    apply(base.sanitize_module_names, o.sanitize_module_names);
    apply(base.remove_line_numbers, o.remove_line_numbers);
    ConfigValidator::normalize(base);
    return base;
}

ErrorContextConfig merge_config(ErrorContextConfig base, const ErrorContextOverrides& o){
    apply(base.generate_secure_ids, o.generate_secure_ids);
    apply(base.preserve_error_codes, o.preserve_error_codes);
    apply(base.redaction_level, o.redaction_level);
    apply(base.include_context_hints, o.include_context_hints);
    apply(base.max_context_length, o.max_context_length);
    apply(base.allowed_properties, o.allowed_properties);
    apply(base.sanitize_nested_objects, o.sanitize_nested_objects);
    apply(base.preserve_timestamps, o.preserve_timestamps);
    apply(base.custom_context_patterns, o.custom_context_patterns);
    apply(base.max_forwarding_size, o.max_forwarding_size);
    ConfigValidator::normalize(base);
    return base;
}

static bool env_flag(const char* name){
    const char* v = std::getenv(name);
    if(!v || !*v) return false;
    std::string s = utils::to_lower(v);
    return s != "0" && s != "false" && s != "no";
}

RuntimeSignals RuntimeSignals::from_environment(int argc, char** argv){
    RuntimeSignals s;
    const char* env = std::getenv("SECSCRUB_ENV");
    if(!env || !*env) env = std::getenv("NODE_ENV");
    if(env) s.environment = utils::to_lower(env);
    s.debug_flag = env_flag("SECSCRUB_DEBUG") || env_flag("DEBUG") || env_flag("CLI_DEBUG");
    for(int i = 1; i < argc && argv; ++i) s.args.emplace_back(argv[i]);
    return s;
}

static std::mutex g_signals_mu;
static RuntimeSignals g_signals = RuntimeSignals::from_environment();

RuntimeSignals runtime_signals(){
    std::lock_guard<std::mutex> lk(g_signals_mu);
    return g_signals;
}

void set_runtime_signals(const RuntimeSignals& s){
    std::lock_guard<std::mutex> lk(g_signals_mu);
    g_signals = s;
}

}
