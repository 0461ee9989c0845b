#include "EnvironmentProfile.h"
#include "../core/Logging.h"
#include <algorithm>

namespace secscrub {

namespace {

ErrorSanitizationConfig development_preset(){
    ErrorSanitizationConfig c;
    c.redact_file_paths = false;
    c.redact_network_info = false;
    c.max_message_length = 1000;
    c.max_stack_depth = 20;
    c.stack_trace_level = StackTraceLevel::Full;
    c.remove_stack_in_production = false;
    c.remove_source_maps = false;
    c.sanitize_module_names = false;
    c.remove_line_numbers = false;
    return c;
}

ErrorSanitizationConfig staging_preset(){
    ErrorSanitizationConfig c;
    c.max_message_length = 750;
    c.max_stack_depth = 15;
    c.stack_trace_level = StackTraceLevel::Sanitized;
    c.remove_source_maps = true;
    c.sanitize_module_names = true;
    c.remove_line_numbers = false;
    return c;
}

ErrorSanitizationConfig production_preset(){
    ErrorSanitizationConfig c;
    c.max_message_length = 250;
    c.max_stack_depth = 5;
    c.stack_trace_level = StackTraceLevel::Minimal;
    c.remove_source_maps = true;
    c.sanitize_module_names = true;
    c.remove_line_numbers = true;
    return c;
}

bool is_production(const RuntimeSignals& s){ return s.environment == "production" || s.environment == "prod"; }
bool is_development(const RuntimeSignals& s){ return s.environment == "development" || s.environment == "dev"; }

} // namespace

ErrorSanitizationConfig create_environment_config(Environment env, const ErrorSanitizationOverrides& overrides){
    ErrorSanitizationConfig base;
    switch(env){
        case Environment::Development: base = development_preset(); break;
        case Environment::Staging: base = staging_preset(); break;
        case Environment::Production: base = production_preset(); break;
    }
    Logger::instance().debug(std::string("profile: ") + to_string(env) + " preset");
    return merge_config(base, overrides);
}

bool should_show_detailed_errors(const RuntimeSignals& signals){
    if(is_production(signals)) return false;
    return signals.debug_flag || is_development(signals) || signals.environment == "test";
}

bool should_show_detailed_errors(){ return should_show_detailed_errors(runtime_signals()); }

bool is_debug_mode(const RuntimeSignals& signals){
    if(is_production(signals)) return false;
    if(signals.debug_flag || is_development(signals)) return true;
    return std::any_of(signals.args.begin(), signals.args.end(),
                       [](const std::string& a){ return a == "--debug" || a == "--verbose"; });
}

bool is_debug_mode(){ return is_debug_mode(runtime_signals()); }

}
