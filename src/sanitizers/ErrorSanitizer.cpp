#include "ErrorSanitizer.h"
#include "MessageRedactor.h"
#include "StackTraceRedactor.h"

namespace secscrub {

static bool is_error_code_key(const std::string& key){
    return key == "code" || key == "errno" || key == "syscall";
}

ErrorInfo sanitize_error_for_production(const ErrorInfo& error, const ErrorSanitizationConfig& config){
    ErrorInfo out;
    out.name = error.name.empty() ? "Error" : error.name;
    out.message = sanitize_error_message(error.message, config);
    // production runtimes drop the trace entirely unless told otherwise
    const std::string env = runtime_signals().environment;
    bool production = env == "production" || env == "prod";
    if(!(production && config.remove_stack_in_production)) out.stack = sanitize_stack_trace(error.stack, config);
    if(config.preserve_error_codes) out.code = error.code;

    for(const auto& m : error.properties.members()){
        const std::string& key = m.first;
        const ContextValue& value = m.second;
        if(key == "message" || key == "name" || key == "stack") continue;
        if(is_error_code_key(key)){
            if(config.preserve_error_codes) out.properties.set(key, value);
            continue;
        }
        switch(value.kind()){
            case ValueKind::String:
                out.properties.set(key, sanitize_error_message(value.text(), config));
                break;
            case ValueKind::Object:
            case ValueKind::Array:
                out.properties.set(key, sanitize_error_message(safe_dump(context_to_json(value)), config));
                break;
            case ValueKind::Null:
            case ValueKind::Boolean:
            case ValueKind::Number:
                out.properties.set(key, value);
                break;
            default:
                out.properties.set(key, describe(value));
                break;
        }
    }
    return out;
}

ErrorInfo sanitize_error_for_production(const ErrorInfo* error, const ErrorSanitizationConfig& config){
    if(!error){
        ErrorInfo unknown;
        unknown.message = "Unknown error occurred";
        return unknown;
    }
    return sanitize_error_for_production(*error, config);
}

}
