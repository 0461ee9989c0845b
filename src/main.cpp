#include "core/Config.h"
#include "core/ContextValue.h"
#include "core/Logging.h"
#include "core/LogSecurity.h"
#include "core/Utils.h"
#include "sanitizers/ContextRedactor.h"
#include "sanitizers/EnvironmentProfile.h"
#include "sanitizers/ErrorSanitizer.h"
#include "sanitizers/InputThreatAnalyzer.h"
#include "sanitizers/MessageRedactor.h"
#include "sanitizers/SecurityAuditor.h"
#include "sanitizers/StackTraceRedactor.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef SECSCRUB_VERSION
#define SECSCRUB_VERSION "0.0.0"
#endif

using namespace secscrub;
using json = nlohmann::ordered_json;

static void print_help(){
    std::cout << "usage: secscrub <mode> [options] < input\n\nmodes:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> modes = {
        {"input", "Threat analysis of untrusted input (JSON report)"},
        {"message", "Redact an error message"},
        {"stack", "Redact a stack trace"},
        {"error", "Production-safe copy of a JSON error object"},
        {"context", "Sanitize a JSON error context ({\"error\":{...},\"context\":{...}})"},
        {"forward", "Telemetry payload for a JSON error context"},
        {"audit-stack", "Risk report for a stack trace"},
        {"audit-context", "Risk report for a JSON context object"},
        {"log", "Neutralize text before it reaches a log"},
    };
    static const std::vector<Line> options = {
        {"--env development|staging|production", "Start from an environment preset"},
        {"--level none|minimal|sanitized|full", "Stack trace detail level"},
        {"--max-length N", "Maximum message length"},
        {"--max-depth N", "Maximum stack frames kept"},
        {"--pretty", "Pretty-print JSON"},
        {"--debug", "Debug logging"},
        {"--verbose", "Trace logging"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    auto emit = [](const std::vector<Line>& lines){
        for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 38) for(size_t i=l.name.size(); i<38; ++i) std::cout << ' '; else std::cout<<' '; std::cout << l.help << "\n"; }
    };
    emit(modes);
    std::cout << "\noptions:\n";
    emit(options);
}

static std::string read_stdin(){
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

static ErrorInfo error_from_json(const json& j){
    ErrorInfo e;
    if(!j.is_object()){ e.message = j.is_string() ? j.get<std::string>() : safe_dump(j); return e; }
    for(auto it = j.begin(); it != j.end(); ++it){
        const std::string& k = it.key();
        const json& v = it.value();
        if(k == "name" && v.is_string()) e.name = v.get<std::string>();
        else if(k == "message" && v.is_string()) e.message = v.get<std::string>();
        else if(k == "stack" && v.is_string()) e.stack = v.get<std::string>();
        else if(k == "code" && !v.is_null()) e.code = v.is_string() ? v.get<std::string>() : safe_dump(v);
        else e.properties.set(k, context_from_json(v));
    }
    return e;
}

static json error_to_json(const ErrorInfo& e){
    json j = json::object();
    j["name"] = e.name;
    j["message"] = e.message;
    if(!e.stack.empty()) j["stack"] = e.stack;
    if(e.code) j["code"] = *e.code;
    json props = context_to_json(e.properties);
    for(auto it = props.begin(); it != props.end(); ++it) j[it.key()] = it.value();
    return j;
}

static json violations_to_json(const SecurityAnalysisResult& r){
    json out = json::object();
    out["isSecure"] = r.is_secure;
    out["riskScore"] = r.risk_score;
    json vs = json::array();
    for(const auto& v : r.violations){
        vs.push_back(json{{"type", v.type}, {"pattern", v.pattern}, {"severity", severity_to_string(v.severity)},
                      {"description", v.description}, {"recommendation", v.recommendation}});
    }
    out["violations"] = vs;
    if(!r.violations.empty()) out["sanitizedInput"] = r.sanitized_input;
    return out;
}

static json sanitized_context_to_json(const SanitizedErrorContext& s){
    json out = json::object();
    out["errorId"] = s.error_id;
    out["context"] = s.context;
    if(s.code) out["code"] = *s.code;
    if(s.timestamp) out["timestamp"] = *s.timestamp;
    out["redactedProperties"] = s.redacted_properties;
    out["securityWarnings"] = s.security_warnings;
    out["hadSensitiveData"] = s.had_sensitive_data;
    json hints = json::object();
    for(const auto& h : s.redaction_hints) hints[h.first] = h.second;
    out["redactionHints"] = hints;
    return out;
}

static json stack_report_to_json(const StackTraceSecurityReport& r){
    json out = json::object();
    out["riskLevel"] = severity_to_string(r.risk_level);
    out["risks"] = r.risks;
    json fs = json::array();
    for(const auto& f : r.findings){
        fs.push_back(json{{"category", f.category}, {"severity", severity_to_string(f.severity)}, {"line", f.line}, {"match", f.match}});
    }
    out["findings"] = fs;
    out["recommendations"] = r.recommendations;
    out["truncated"] = r.truncated;
    return out;
}

static json context_report_to_json(const ContextSecurityReport& r){
    json out = json::object();
    out["riskLevel"] = severity_to_string(r.risk_level);
    json ds = json::array();
    for(const auto& d : r.detections){
        ds.push_back(json{{"path", d.property_path}, {"type", d.sensitive_type}, {"hint", d.hint}, {"severity", severity_to_string(d.severity)}});
    }
    out["detections"] = ds;
    out["recommendations"] = r.recommendations;
    out["estimatedRedactionPercentage"] = r.estimated_redaction_percentage;
    if(!r.warnings.empty()) out["warnings"] = r.warnings;
    return out;
}

int main(int argc, char** argv) {
    set_runtime_signals(RuntimeSignals::from_environment(argc, argv));
    Logger::instance().set_level(is_debug_mode() ? LogLevel::Debug : LogLevel::Info);

    std::string mode;
    bool pretty = false;
    bool have_env = false;
    Environment env = Environment::Production;
    ErrorSanitizationOverrides overrides;
    enum class ArgKind { None, String, Int };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    auto need_int = [](const std::string& v, const char* flag, int& out){
        try { size_t pos = 0; out = std::stoi(v, &pos); if(pos == v.size()) return true; }
        catch(const std::logic_error& e) { Logger::instance().debug(std::string("cli: ") + e.what()); }
        std::cerr << "Invalid integer for " << flag << "\n";
        return false;
    };
    std::vector<FlagSpec> specs = {
        {"--env", ArgKind::String, [&](const std::string& v){
            if(!parse_environment(v, env)){ std::cerr << "Invalid --env value: " << v << "\n"; return false; }
            have_env = true; return true; }},
        {"--level", ArgKind::String, [&](const std::string& v){
            StackTraceLevel l;
            if(!parse_stack_trace_level(v, l)){ std::cerr << "Invalid --level value: " << v << "\n"; return false; }
            overrides.stack_trace_level = l; return true; }},
        {"--max-length", ArgKind::Int, [&](const std::string& v){ int n = 0; if(!need_int(v, "--max-length", n)) return false; overrides.max_message_length = n; return true; }},
        {"--max-depth", ArgKind::Int, [&](const std::string& v){ int n = 0; if(!need_int(v, "--max-depth", n)) return false; overrides.max_stack_depth = n; return true; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ pretty = true; return true; }},
        {"--debug", ArgKind::None, [&](const std::string&){ Logger::instance().set_level(LogLevel::Debug); return true; }},
        {"--verbose", ArgKind::None, [&](const std::string&){ Logger::instance().set_level(LogLevel::Trace); return true; }},
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return 0; }
        if(a=="--version"){ std::cout << "secscrub " << SECSCRUB_VERSION << "\n"; return 0; }
        if(a.size() > 2 && a.compare(0, 2, "--") == 0){
            auto* spec = find_spec(a);
            if(!spec){ std::cerr << "Unknown arg: "<<a<<"\n"; print_help(); return 2; }
            std::string val;
            if(spec->kind != ArgKind::None){ if(i+1>=argc){ std::cerr << "Missing value for "<<a<<"\n"; return 2; } val = argv[++i]; }
            if(!spec->apply(val)) return 2;
            continue;
        }
        if(!mode.empty()){ std::cerr << "Unexpected argument: " << a << "\n"; return 2; }
        mode = a;
    }
    if(mode.empty()){ print_help(); return 2; }

    // Without --env the runtime environment picks the preset; unknown or unset means production.
    if(!have_env && !parse_environment(runtime_signals().environment, env)) env = Environment::Production;
    ErrorSanitizationConfig cfg = create_environment_config(env, overrides);
    Logger::instance().debug(std::string("cli: mode=") + mode + " env=" + to_string(env) + " level=" + to_string(cfg.stack_trace_level));

    const int indent = pretty ? 2 : -1;
    const std::string input = read_stdin();
    auto parse_json = [&](json& out){
        try { out = json::parse(input); return true; }
        catch(const json::parse_error& e){ std::cerr << "Invalid JSON input: " << sanitize_log_output(e.what()) << "\n"; return false; }
    };

    if(mode == "input"){
        std::cout << safe_dump(violations_to_json(analyze_input_security(input)), indent) << "\n";
    } else if(mode == "message"){
        std::cout << sanitize_error_message(input, cfg) << "\n";
    } else if(mode == "stack"){
        std::cout << sanitize_stack_trace(input, cfg) << "\n";
    } else if(mode == "log"){
        std::cout << sanitize_log_output(input) << "\n";
    } else if(mode == "audit-stack"){
        std::cout << safe_dump(stack_report_to_json(analyze_stack_trace_security(input)), indent) << "\n";
    } else if(mode == "error" || mode == "context" || mode == "forward" || mode == "audit-context"){
        json doc;
        if(!parse_json(doc)) return 3;
        if(mode == "audit-context"){
            std::cout << safe_dump(context_report_to_json(analyze_error_context_security(context_from_json(doc))), indent) << "\n";
            return 0;
        }
        json err = doc.is_object() && doc.contains("error") ? doc["error"] : (mode == "error" ? doc : json::object());
        ContextValue ctx = doc.is_object() && doc.contains("context") ? context_from_json(doc["context"])
                         : (mode == "error" ? ContextValue::object() : context_from_json(doc));
        ErrorInfo error = error_from_json(err);
        if(mode == "error"){
            std::cout << safe_dump(error_to_json(sanitize_error_for_production(error, cfg)), indent) << "\n";
        } else if(mode == "context"){
            std::cout << safe_dump(sanitized_context_to_json(sanitize_error_context(error, ctx)), indent) << "\n";
        } else {
            std::cout << safe_dump(create_safe_error_for_forwarding(error, ctx).to_json(), indent) << "\n";
        }
    } else {
        std::cerr << "Unknown mode: " << mode << "\n";
        print_help();
        return 2;
    }
    return 0;
}
