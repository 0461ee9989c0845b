#include "SecurityAuditor.h"
#include "../core/ConfigValidator.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <algorithm>
#include <regex>
#include <set>

namespace secscrub {

namespace {

struct StackCategory {
    const char* name;
    Severity severity;
    std::regex re;
    const char* recommendation;
};

constexpr size_t LONG_RUN = 51;

const std::vector<StackCategory>& stack_categories(){
    static const std::vector<StackCategory> cats = {
        {"home-directory", Severity::High,
         std::regex(R"((?:/Users/|/home/)[^/\s]{1,64}|[A-Za-z]:\\(?:Users|Documents and Settings)\\[^\\\s]{1,64})"),
         "Redact user home directories from stack traces"},
        {"source-maps", Severity::Low,
         std::regex(R"(sourceMappingURL|\.(?:js|ts)\.map\b)"),
         "Strip source map references before exposing stack traces"},
        {"sensitive-names", Severity::Medium,
         std::regex(R"(password|secret|token|api[_-]?key|credential|private[_-]?key|\.env\b|\.ssh\b|id_rsa)",
                    std::regex::ECMAScript | std::regex::icase),
         "Remove sensitive file and credential names from stack frames"},
        {"internal-structure", Severity::Medium,
         std::regex(R"(node_modules[/\\]|\binternal/|\(internal\b|webpack://|\bsrc/(?:lib|core|internal)/)"),
         "Sanitize module names to hide internal project structure"},
        {"deployment-paths", Severity::High,
         std::regex(R"(/(?:opt|srv|var/www|app|deploy|releases)/|[A-Za-z]:\\(?:inetpub|deploy)\\)",
                    std::regex::ECMAScript | std::regex::icase),
         "Hide deployment paths from externally visible errors"},
    };
    return cats;
}

const char* const kLongPathRecommendation = "Truncate abnormally long or repetitive stack lines";
const char* const kGeneralRecommendation = "Consider using higher stack trace sanitization level";

bool has_long_run(const std::string& line){
    size_t run = 0;
    for(size_t i = 0; i < line.size(); ++i){
        run = (i > 0 && line[i] == line[i - 1]) ? run + 1 : 1;
        if(run >= LONG_RUN && line[i] != ' ') return true;
    }
    return false;
}

size_t count_properties(const nlohmann::ordered_json& j, int depth = 0){
    if(depth > MAX_CONTEXT_DEPTH || !j.is_structured()) return 0;
    size_t n = 0;
    for(const auto& child : j) n += 1 + count_properties(child, depth + 1);
    return n;
}

const char* context_recommendation(const std::string& type){
    if(type == "password/secret") return "Remove credentials from error context before logging";
    if(type == "api-key/token") return "Never attach API keys or tokens to error context";
    if(type == "personal-email") return "Avoid including personal data such as email addresses";
    if(type == "file-path") return "Redact file system paths from error context";
    if(type == "url-with-credentials" || type == "database-connection") return "Strip credentials from URLs and connection strings";
    if(type == "ip-address") return "Redact internal network addresses";
    if(type == "custom-pattern") return "Review values matching custom sensitive patterns";
    if(type == "sensitive-array") return "Sanitize arrays that carry sensitive elements";
    return nullptr;
}

void add_unique(std::vector<std::string>& v, const std::string& s){
    if(std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

} // namespace

StackTraceSecurityReport analyze_stack_trace_security(const std::string& stack){
    StackTraceSecurityReport rep;
    std::string input = stack;
    if(input.size() > AUDIT_MAX_STACK_CHARS){
        input = utils::utf8_prefix(input, AUDIT_MAX_STACK_CHARS);
        rep.truncated = true;
    }
    std::vector<std::string> lines = utils::split_lines(input);
    if(lines.size() > AUDIT_MAX_STACK_LINES){
        lines.resize(AUDIT_MAX_STACK_LINES);
        rep.truncated = true;
    }

    for(size_t i = 0; i < lines.size(); ++i){
        std::string line = lines[i];
        bool overlong = line.size() > AUDIT_MAX_LINE_LENGTH;
        if(overlong) line = utils::utf8_prefix(line, AUDIT_MAX_LINE_LENGTH) + "...";
        for(const auto& cat : stack_categories()){
            std::smatch m;
            if(std::regex_search(line, m, cat.re)){
                rep.findings.push_back({cat.name, cat.severity, i + 1, m.str(0)});
                add_unique(rep.risks, cat.name);
            }
        }
        if(overlong || has_long_run(line)){
            rep.findings.push_back({"long-paths", Severity::Medium, i + 1, overlong ? "line length" : "repeated characters"});
            add_unique(rep.risks, "long-paths");
        }
    }

    size_t high = static_cast<size_t>(std::count_if(rep.findings.begin(), rep.findings.end(),
        [](const StackFinding& f){ return f.severity == Severity::High; }));
    if(high >= 2 || rep.findings.size() >= 5 || rep.risks.size() >= 3) rep.risk_level = Severity::High;
    else if(!rep.findings.empty()) rep.risk_level = Severity::Medium;
    for(const char* escalating : {"home-directory", "deployment-paths", "sensitive-names"}){
        if(std::find(rep.risks.begin(), rep.risks.end(), escalating) != rep.risks.end()) rep.risk_level = Severity::High;
    }

    for(const auto& risk : rep.risks){
        if(risk == "long-paths"){ rep.recommendations.push_back(kLongPathRecommendation); continue; }
        for(const auto& cat : stack_categories()){
            if(risk == cat.name) rep.recommendations.push_back(cat.recommendation);
        }
    }
    if(!rep.risks.empty()) rep.recommendations.push_back(kGeneralRecommendation);
    Logger::instance().debug("audit: stack risk " + std::string(severity_to_string(rep.risk_level)) +
                             " (" + std::to_string(rep.findings.size()) + " findings)");
    return rep;
}

ContextSecurityReport analyze_error_context_security(const ContextValue& context, const ErrorContextConfig& config){
    ErrorContextConfig cfg = config;
    ConfigValidator::normalize(cfg);
    ContextSecurityReport rep;
    nlohmann::ordered_json j = context_to_json(strip_dangerous_keys(context, rep.warnings), &rep.warnings);
    if(!j.is_object()){
        nlohmann::ordered_json wrapped = nlohmann::ordered_json::object();
        wrapped["value"] = std::move(j);
        j = std::move(wrapped);
    }
    rep.detections = detect_sensitive_context(j, cfg);

    size_t high = 0;
    bool critical = false;
    std::vector<std::string> types;
    std::set<std::string> paths;
    for(const auto& d : rep.detections){
        if(d.severity == Severity::Critical) critical = true;
        if(d.severity == Severity::High) ++high;
        add_unique(types, d.sensitive_type);
        paths.insert(d.property_path);
    }
    if(critical) rep.risk_level = Severity::Critical;
    else if(high >= 2 || rep.detections.size() >= 5) rep.risk_level = Severity::High;
    else if(!rep.detections.empty()) rep.risk_level = Severity::Medium;

    for(const auto& t : types){
        if(const char* r = context_recommendation(t)) add_unique(rep.recommendations, r);
    }
    if(!rep.detections.empty()) rep.recommendations.push_back("Use partial or full redaction level when forwarding this context");

    size_t total = count_properties(j);
    if(total > 0){
        size_t pct = (paths.size() * 100 + total / 2) / total;
        rep.estimated_redaction_percentage = static_cast<int>(std::min<size_t>(pct, 100));
    }
    return rep;
}

}
