#include "InputSanitizer.h"
#include "InputThreatAnalyzer.h"
#include "../core/PatternCatalog.h"
#include "../core/Utils.h"
#include <algorithm>
#include <regex>

namespace secscrub {

namespace {

const char* const kTraversalRules[] = {
    "DOTDOT_SLASH", "DOTDOT_ENCODED", "DOUBLE_ENCODED", "TRIPLE_ENCODED",
    "OVERLONG_UTF8", "OVERLONG_BACKSLASH", "MIXED_ENCODED"
};

const char* const kScriptRules[] = {
    "EVAL_USAGE", "FUNCTION_CONSTRUCTOR", "SCRIPT_TAG", "SCRIPT_OPEN_TAG", "JAVASCRIPT_PROTOCOL",
    "SQL_KEYWORDS", "NOSQL_OPERATORS", "TEMPLATE_INJECTION"
};

const char* const kTrustedPackageManagers[] = {
    "npm", "pnpm", "yarn", "bun", "deno", "cargo", "pip", "composer", "maven", "gradle"
};

constexpr int MAX_TRAVERSAL_PASSES = 32;

std::string erase(const std::string& s, const char* rule){
    return std::regex_replace(s, pattern_catalog().rule(rule), "");
}

// Removal can splice a new sequence together ("....//"), so repeat to a fixed point.
std::string strip_traversal(std::string s){
    const PatternCatalog& catalog = pattern_catalog();
    for(int pass = 0; pass < MAX_TRAVERSAL_PASSES; ++pass){
        std::string before = s;
        for(const char* r : kTraversalRules) s = erase(s, r);
        s = catalog.strip_lookalike_traversal(s);
        s = catalog.strip_codepoints(s, CodepointClass::NullByte);
        if(s == before) return s;
    }
    // pathological nesting: drop every remaining dot pair
    std::string out;
    for(size_t i = 0; i < s.size(); ++i){
        if(s[i] == '.' && i + 1 < s.size() && s[i+1] == '.'){ ++i; continue; }
        out.push_back(s[i]);
    }
    return out;
}

std::string collapse_whitespace(const std::string& s){
    static const std::regex ws(R"(\s{1,64})");
    return utils::trim(std::regex_replace(s, ws, " "));
}

} // namespace

std::string sanitize_input(const std::string& input){
    const PatternCatalog& catalog = pattern_catalog();
    std::string s = strip_traversal(utils::utf8_prefix(input, MAX_INPUT_LENGTH));

    for(const char* r : kScriptRules) s = erase(s, r);
    s = erase(s, "SHELL_METACHARACTERS");
    s = erase(s, "DANGEROUS_COMMANDS");
    s = erase(s, "DANGEROUS_KEYWORDS");
    s = erase(s, "PATH_MANIPULATION");
    s = erase(s, "IFS_BYPASS");
    s = catalog.strip_codepoints(s, CodepointClass::Bidi);
    s = catalog.strip_codepoints(s, CodepointClass::ZeroWidth);
    s = erase(s, "PROTOTYPE_POLLUTION");
    s = catalog.fold_homographs(s);
    // deleting metacharacters may have joined a new traversal sequence
    return strip_traversal(s);
}

bool is_path_safe(const std::string& path){
    SecurityAnalysisResult r = analyze_input_security(path);
    return r.is_secure && r.risk_score < 10;
}

bool is_path_safe(const char* path){
    if(!path) return false;
    return is_path_safe(std::string(path));
}

bool is_command_safe(const std::string& command){
    SecurityAnalysisResult r = analyze_input_security(command);
    if(r.has_violation("command-injection") || r.has_violation("privilege-escalation")) return false;
    return !std::regex_search(command, pattern_catalog().rule("DANGEROUS_COMMANDS"));
}

bool is_command_safe(const char* command){
    if(!command) return true;
    return is_command_safe(std::string(command));
}

bool is_project_name_safe(const std::string& name){
    if(name.empty() || name.size() > MAX_INPUT_LENGTH) return false;
    const PatternCatalog& catalog = pattern_catalog();
    for(const auto& cp : utils::decode_utf8(name)){
        if(!catalog.is_project_name_char(cp.value)) return false;
    }
    return analyze_input_security(name).is_secure;
}

bool is_project_name_safe(const char* name){
    if(!name) return false;
    return is_project_name_safe(std::string(name));
}

bool sanitize_command_args(const std::vector<std::string>& args, std::vector<std::string>& out,
                           std::string& error, bool strict){
    out.clear();
    if(args.size() > MAX_COMMAND_ARGS){
        error = "too many arguments (" + std::to_string(args.size()) + ")";
        return false;
    }
    size_t total = 0;
    for(const auto& a : args){
        total += a.size();
        if(total > MAX_INPUT_LENGTH){
            out.clear();
            error = "arguments exceed " + std::to_string(MAX_INPUT_LENGTH) + " bytes";
            return false;
        }
        std::string v = utils::trim(a);
        if(v.empty()) continue;
        if(!is_command_safe(v)){
            if(strict){
                out.clear();
                error = "unsafe argument at position " + std::to_string(&a - args.data());
                return false;
            }
            v = erase(v, "SHELL_METACHARACTERS");
            v = erase(v, "DANGEROUS_COMMANDS");
            v = collapse_whitespace(v);
            if(v.empty()) continue;
        }
        if(v.find_first_of(" \t'\"\\") != std::string::npos){
            std::string quoted = "'";
            for(char c : v){
                if(c == '\'') quoted += "'\\''";
                else quoted.push_back(c);
            }
            quoted += "'";
            v = quoted;
        }
        out.push_back(v);
    }
    return true;
}

bool is_trusted_package_manager(const std::string& name){
    std::string n = utils::to_lower(utils::trim(name));
    return std::any_of(std::begin(kTrustedPackageManagers), std::end(kTrustedPackageManagers),
                       [&](const char* pm){ return n == pm; });
}

}
