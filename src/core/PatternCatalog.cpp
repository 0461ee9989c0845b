#include "PatternCatalog.h"
#include "Utils.h"
#include <stdexcept>

namespace secscrub {

namespace {

struct CodepointRange { char32_t first; char32_t last; };

constexpr CodepointRange kCyrillic[] = {{0x0410, 0x044F}};
constexpr CodepointRange kGreek[] = {{0x0391, 0x03A9}, {0x03B1, 0x03C9}};
constexpr CodepointRange kBidi[] = {{0x061C, 0x061C}, {0x200E, 0x200F}, {0x202A, 0x202E}, {0x2066, 0x2069}};
constexpr CodepointRange kZeroWidth[] = {{0x200B, 0x200D}, {0x2060, 0x2060}, {0xFEFF, 0xFEFF}};
constexpr CodepointRange kDotLookalike[] = {{0x2024, 0x2024}, {0xFF0E, 0xFF0E}};
constexpr CodepointRange kSlashLookalike[] = {{0x2044, 0x2044}, {0xFF0F, 0xFF0F}};
constexpr CodepointRange kNull[] = {{0x0000, 0x0000}};

// Latin-1 letters accepted in project names besides [A-Za-z0-9._-]
constexpr CodepointRange kProjectNameExtra[] = {
    {0x00C0, 0x00CF}, {0x00D1, 0x00D6}, {0x00D8, 0x00DD},
    {0x00E0, 0x00EF}, {0x00F1, 0x00F6}, {0x00F8, 0x00FD}, {0x00FF, 0x00FF}, {0x0178, 0x0178}
};

struct HomographMapping { char32_t from; char to; };

// Cyrillic entries are matched after lower-casing.
constexpr HomographMapping kHomographMap[] = {
    {0x0430, 'a'}, {0x0435, 'e'}, {0x043E, 'o'}, {0x0440, 'p'}, {0x0441, 'c'}, {0x0443, 'y'}, {0x0445, 'x'},
    {0x03B1, 'a'}, {0x03BF, 'o'}, {0x03C1, 'p'}, {0x03C5, 'y'},
    {0x0391, 'A'}, {0x039F, 'O'}, {0x03A1, 'P'},
};

template<size_t N>
bool in_ranges(char32_t cp, const CodepointRange (&ranges)[N]){
    for(const auto& r : ranges) if(cp >= r.first && cp <= r.last) return true;
    return false;
}

bool is_dot_like(const PatternCatalog& c, char32_t cp){ return cp == U'.' || c.in_class(cp, CodepointClass::DotLookalike); }
bool is_slash_like(const PatternCatalog& c, char32_t cp){
    return cp == U'/' || cp == U'\\' || c.in_class(cp, CodepointClass::SlashLookalike);
}

// Length in code points of a lookalike traversal starting at i, 0 if none.
size_t lookalike_traversal_at(const PatternCatalog& c, const std::vector<utils::CodePoint>& cps, size_t i){
    size_t n = cps.size();
    if(i + 2 < n && is_dot_like(c, cps[i].value) && is_dot_like(c, cps[i+1].value) && is_slash_like(c, cps[i+2].value)){
        bool variant = cps[i].value > 0x7F || cps[i+1].value > 0x7F || cps[i+2].value > 0x7F;
        if(variant) return 3;
    }
    if(i < n && cps[i].value == U'.'){
        size_t j = i + 1, zw = 0;
        while(j < n && c.in_class(cps[j].value, CodepointClass::ZeroWidth)) { ++j; ++zw; }
        if(zw == 0 || j >= n || cps[j].value != U'.') return 0;
        ++j;
        while(j < n && c.in_class(cps[j].value, CodepointClass::ZeroWidth)) ++j;
        if(j < n && (cps[j].value == U'/' || cps[j].value == U'\\')) return j + 1 - i;
    }
    return 0;
}

} // namespace

const PatternCatalog& pattern_catalog(){
    static const PatternCatalog catalog;
    return catalog;
}

PatternCatalog::PatternCatalog(){
    load_threat_rules();
    load_disclosure_rules();
}

const std::regex& PatternCatalog::rule(const std::string& name) const {
    auto it = rules_.find(name);
    if(it == rules_.end()) throw std::out_of_range("unknown pattern rule: " + name);
    return it->second;
}

const std::vector<DisclosureRule>& PatternCatalog::disclosure_rules(DisclosureCategory c) const {
    static const std::vector<DisclosureRule> empty;
    auto it = disclosure_.find(c);
    return it == disclosure_.end() ? empty : it->second;
}

void PatternCatalog::add_rule(const std::string& name, const char* re, bool icase){
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if(icase) flags |= std::regex::icase;
    rules_.emplace(name, std::regex(re, flags));
}

void PatternCatalog::add_check(ThreatCheck check, const std::vector<std::string>& rule_names){
    for(const auto& n : rule_names) check.rules.push_back(&rule(n));
    checks_.push_back(std::move(check));
}

void PatternCatalog::add_disclosure(DisclosureCategory c, const std::string& name, const std::string& re, Severity sev,
                                    RedactionStrategy strategy, bool icase, bool extend, const std::string& fixed){
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if(icase) flags |= std::regex::icase;
    disclosure_[c].push_back(DisclosureRule{name, std::regex(re, flags), sev, strategy, fixed, extend});
}

void PatternCatalog::load_threat_rules(){
    // path traversal
    add_rule("DOTDOT_SLASH", R"(\.\.[/\\])");
    add_rule("DOTDOT_ENCODED", R"(%2e%2e(?:%2f|%5c))", true);
    add_rule("DOUBLE_ENCODED", R"(%252e%252e(?:%252f|%255c))", true);
    add_rule("TRIPLE_ENCODED", R"(%25252e%25252e%25252f)", true);
    add_rule("OVERLONG_UTF8", R"(%c0%ae%c0%ae)", true);
    add_rule("OVERLONG_BACKSLASH", R"(%c1%9c)", true);
    add_rule("MIXED_ENCODED", R"(\.\.(?:%252f|%252c|%2f|%5c|%c0%af))", true);
    add_rule("UNC_PATH", R"(^\\\\[^\\]{1,255}\\[^\\])");
    add_rule("DRIVE_ROOT", R"(^[a-zA-Z]:[\\/]$)");
    add_rule("ROOT_PATH", R"(^/[^/])");
    add_rule("TILDE_EXPANSION", R"(^~[/\\])");

    // command injection
    add_rule("SHELL_METACHARACTERS", R"([;&|`$(){}\[\]<>])");
    add_rule("COMMAND_CHAINING", R"(&&|\|\||;)");
    add_rule("SUBPROCESS", R"(\$\([^)]{0,256}\))");
    add_rule("BACKTICK", R"(`[^`]{0,256}`)");
    add_rule("REDIRECTION", R"([<>]{1,2})");
    add_rule("PIPE", R"(\|)");
    add_rule("ENV_VAR", R"(\$\{[^}]{0,256}\})");
    add_rule("PATH_MANIPULATION", R"(PATH\s{0,16}=|LD_PRELOAD\s{0,16}=|BASH_ENV\s{0,16}=|ENV\s{0,16}=)", true);
    add_rule("IFS_BYPASS", R"(\$IFS\$|\$\{IFS\})");
    add_rule("QUOTE_ESCAPING", R"(\$['"][^'"]{0,256}['"]|\\\\)");
    add_rule("DANGEROUS_COMMANDS",
             R"(\b(?:rm|del|format|fdisk|mkfs|dd|cat|curl|wget|nc|netcat|telnet|ssh|ftp|tftp|eval|exec|system)\s)", true);
    add_rule("DANGEROUS_KEYWORDS", R"(\b(?:eval|alert|script|exec|system|rm|del)\b)", true);

    // script / template injection
    add_rule("EVAL_USAGE", R"(\beval\s{0,16}\()", true);
    add_rule("FUNCTION_CONSTRUCTOR", R"(\bFunction\s{0,16}\()", true);
    add_rule("SET_TIMEOUT_STRING", R"(\bsetTimeout\s{0,16}\(\s{0,16}['"`])", true);
    add_rule("SET_INTERVAL_STRING", R"(\bsetInterval\s{0,16}\(\s{0,16}['"`])", true);
    add_rule("SCRIPT_TAG", R"(<script[^>]{0,256}>[\s\S]{0,2048}?</script\s{0,8}>)", true);
    add_rule("SCRIPT_OPEN_TAG", R"(<script[^>]{0,256}>)", true);
    add_rule("JAVASCRIPT_PROTOCOL", R"(javascript\s{0,8}:)", true);
    add_rule("DATA_URI", R"(data:\s{0,8}text/html)", true);
    // only stripped by sanitize_input; no threat check scores on it
    add_rule("SQL_KEYWORDS", R"(\b(?:SELECT|INSERT|UPDATE|DELETE|DROP|CREATE|ALTER|EXEC|UNION)\b)", true);
    add_rule("NOSQL_OPERATORS", R"(\$where|\$regex|\$ne|\$gt|\$lt)", true);
    add_rule("TEMPLATE_INJECTION", R"(\{\{[^\n]{0,256}?\}\}|\$\{[^\n]{0,256}?\})");

    // privilege escalation
    add_rule("SUDO", R"(\bsudo\s)", true);
    add_rule("SU", R"(\bsu\s)", true);
    add_rule("RUNAS", R"(\brunas\s)", true);
    add_rule("UAC_BYPASS", R"(\bbypassuac\b)", true);
    add_rule("SETUID", R"(\b(?:chmod\s{1,8}[0-7]{0,4}[4-7][0-7]{0,4}|chown\s{1,8}root))", true);
    add_rule("SERVICE_CONTROL", R"(\b(?:systemctl|service|sc\.exe)\s)", true);
    add_rule("REGISTRY_EDIT", R"(\b(?:reg\s{1,8}add|regedit)\s)", true);
    add_rule("KERNEL_MODULE", R"(\b(?:insmod|modprobe|rmmod)\s)", true);

    // filesystem
    add_rule("UNIX_SENSITIVE_FILES", R"(/(?:etc/passwd|etc/shadow|etc/hosts|root/|proc/|sys/|dev/))", true);
    add_rule("WINDOWS_SENSITIVE_FILES",
             R"(\\(?:windows\\system32|windows\\syswow64|program files|users\\[^\\]{0,255}\\desktop))", true);
    add_rule("WINDOWS_DEVICE_NAMES", R"(^(?:CON|PRN|AUX|NUL|COM[1-9]|LPT[1-9])$)", true);
    add_rule("WINDOWS_DEVICE_NAME_VARIANTS", R"(^(?:CON|PRN|AUX|NUL|COM[1-9]|LPT[1-9])(?:[\s.]|$))", true);
    add_rule("FILENAME_EDGE_CASES", R"([\s.]$)");
    add_rule("CONFIG_EXTENSIONS", R"(\.(?:conf|config|cfg|ini|env|key|pem|p12|pfx)$)", true);
    add_rule("BACKUP_EXTENSIONS", R"(\.(?:bak|backup|tmp|temp|old|orig|save)$)", true);
    add_rule("EXECUTABLE_EXTENSIONS", R"(\.(?:exe|bat|cmd|com|scr|pif|msi|dll|so|dylib)$)", true);

    // network
    add_rule("SUSPICIOUS_PROTOCOLS", R"(^(?:file|ftp|gopher|ldap|dict|telnet|ssh):)", true);
    add_rule("PRIVATE_IPS", R"(\b(?:10\.|172\.(?:1[6-9]|2[0-9]|3[01])\.|192\.168\.))");
    add_rule("LOCALHOST", R"(\b(?:localhost|127\.|0\.0\.0\.0)|::1\b)", true);
    add_rule("SENSITIVE_PORTS", R"(:(?:22|23|53|135|139|445|1433|1521|3306|3389|5432|5900|6379)\b)");

    // advanced
    add_rule("PROTOTYPE_POLLUTION", R"(__proto__|constructor\.prototype|\.prototype\.|\.constructor)", true);

    // deserialization
    add_rule("JAVA_SERIALIZED", R"(\xac\xed\x00\x05|rO0AB)");
    add_rule("PYTHON_PICKLE", R"(\x80[\x02-\x04]|c__builtin__|cos\nsystem)");
    add_rule("PHP_SERIALIZED", R"([Oo]:[0-9]{1,10}:")");
    add_rule("DANGEROUS_CLASSES", R"(\b(?:eval|exec|system|shell_exec|file_get_contents|fopen|include|require)\b)", true);

    // xml external entities
    add_rule("EXTERNAL_ENTITY", R"(<!ENTITY[^>]{1,512}SYSTEM[^>]{1,512}>)", true);
    add_rule("DOCTYPE_EXTERNAL", R"(<!DOCTYPE[^>]{1,512}SYSTEM[^>]{0,512}>)", true);
    add_rule("XML_BOMB", R"(&lol[0-9]{0,8}(?:lol[0-9]{0,8})?;)", true);

    // server-side templates; expression bodies stop at braces and line ends
    add_rule("JINJA2_INJECTION", R"(\{\{[^{}\n\r]{0,256}?(?:\.|_|config|request|session|g)[^{}\n\r]{0,256}?\}\})", true);
    add_rule("JINJA2_DANGEROUS",
             R"(\{\{[^{}\n\r]{0,256}?(?:popen|system|eval|exec|import|builtins|globals)[^{}\n\r]{0,256}?\}\})", true);
    add_rule("TWIG_DANGEROUS", R"(\{\{[^{}\n\r]{0,256}?(?:system|exec|shell_exec|passthru)[^{}\n\r]{0,256}?\}\})", true);
    add_rule("FREEMARKER_DANGEROUS",
             R"(\$\{[^{}\n\r]{0,256}?(?:freemarker\.template\.utility\.Execute|ObjectConstructor)[^{}\n\r]{0,256}?\})", true);
    add_rule("TEMPLATE_EXECUTION",
             R"(\{\{[^{}\n\r]{0,256}?(?:eval|exec|system|import|require|constructor)[^{}\n\r]{0,256}?\}\})", true);
    add_rule("TEMPLATE_OBJECT_ACCESS",
             R"(\{\{[^{}\n\r]{0,256}?(?:__[A-Za-z0-9]{1,64}__|prototype|constructor|process)[^{}\n\r]{0,256}?\}\})", true);

    // ldap / xpath
    add_rule("LDAP_FILTER_INJECTION", R"([()&|!*\\])");
    add_rule("LDAP_DANGEROUS_ATTRIBUTES", R"(\b(?:objectClass|cn|uid|userPassword|memberOf|dn)\s{0,16}=)", true);
    add_rule("XPATH_OPERATORS", R"(['"]\s{0,16}or\s{0,16}['"])", true);
    add_rule("XPATH_AND_OR", R"(\b(?:and|or)\s{1,16}['"])", true);
    add_rule("XPATH_FUNCTIONS", R"(\b(?:substring|contains|starts-with|string-length|position|last|count)\s{0,16}\()", true);

    // expression language
    add_rule("JSP_EL_DANGEROUS", R"(\$\{[^{}\n\r]{0,256}?(?:Runtime|ProcessBuilder|System|Class|Method)[^{}\n\r]{0,256}?\})", true);
    add_rule("SPRING_EL_DANGEROUS",
             R"(#\{[^{}\n\r]{0,256}?(?:T\(|new |Runtime|ProcessBuilder|System\.getProperty)[^{}\n\r]{0,256}?\})", true);
    add_rule("OGNL_DANGEROUS", R"(%\{[^{}\n\r]{0,256}?(?:Runtime|ProcessBuilder|System|@java\.lang)[^{}\n\r]{0,256}?\})", true);
    add_rule("EL_EXECUTION",
             R"(\$\{[^{}\n\r]{0,256}?(?:Runtime\.getRuntime\(\)|ProcessBuilder|System\.exit)[^{}\n\r]{0,256}?\})", true);
    add_rule("EL_REFLECTION",
             R"(\$\{[^{}\n\r]{0,256}?(?:Class\.forName|getClass\(\)|getDeclaredMethod)[^{}\n\r]{0,256}?\})", true);

    // spreadsheet formulas
    add_rule("FORMULA_STARTERS", R"(^\s{0,64}[=+\-@])");
    add_rule("CSV_DANGEROUS_FUNCTIONS", R"(\b(?:HYPERLINK|IMPORTXML|WEBSERVICE|INDIRECT|OFFSET)\s{0,16}\()", true);
    add_rule("DDE_INJECTION", R"(=[^|\n\r]{0,256}\|[^!\n\r]{0,256}!)", true);

    add_check({"path-traversal", "directory-traversal", Severity::Critical, 40,
               "Path traversal sequence detected",
               "Use validated relative paths inside the working directory", {}, {CodepointClass::NullByte}, true},
              {"DOTDOT_SLASH", "DOTDOT_ENCODED", "DOUBLE_ENCODED", "TRIPLE_ENCODED", "OVERLONG_UTF8",
               "OVERLONG_BACKSLASH", "MIXED_ENCODED", "UNC_PATH", "DRIVE_ROOT", "ROOT_PATH", "TILDE_EXPANSION"});
    add_check({"command-injection", "shell-metacharacters", Severity::High, 30,
               "Shell metacharacters detected",
               "Pass arguments as a list and never through a shell", {}, {}, false},
              {"SHELL_METACHARACTERS", "COMMAND_CHAINING", "SUBPROCESS", "BACKTICK", "REDIRECTION", "PIPE", "ENV_VAR"});
    add_check({"command-injection", "advanced-injection", Severity::Critical, 45,
               "Environment manipulation or quoting bypass detected",
               "Reject input that sets PATH/LD_PRELOAD or abuses IFS and quoting", {}, {}, false},
              {"PATH_MANIPULATION", "IFS_BYPASS", "QUOTE_ESCAPING"});
    add_check({"command-injection", "dangerous-commands", Severity::Critical, 40,
               "Potentially destructive command detected",
               "Restrict execution to an allow-list of commands", {}, {}, false},
              {"DANGEROUS_COMMANDS"});
    add_check({"script-injection", "eval-usage", Severity::Critical, 50,
               "Dynamic code evaluation detected",
               "Never evaluate user-supplied input as code", {}, {}, false},
              {"EVAL_USAGE"});
    add_check({"script-injection", "dynamic-code", Severity::High, 30,
               "Function constructor or string timer detected",
               "Avoid constructing code from strings", {}, {}, false},
              {"FUNCTION_CONSTRUCTOR", "SET_TIMEOUT_STRING", "SET_INTERVAL_STRING"});
    add_check({"script-injection", "script-tag", Severity::High, 35,
               "Script tag or script URL detected",
               "Escape markup before rendering", {}, {}, false},
              {"SCRIPT_TAG", "SCRIPT_OPEN_TAG", "JAVASCRIPT_PROTOCOL", "DATA_URI"});
    add_check({"script-injection", "template-injection", Severity::Medium, 20,
               "Template interpolation markers detected",
               "Do not pass user input to template engines", {}, {}, false},
              {"TEMPLATE_INJECTION"});
    add_check({"script-injection", "nosql-operators", Severity::Medium, 20,
               "NoSQL query operators detected",
               "Validate query input against a schema", {}, {}, false},
              {"NOSQL_OPERATORS"});
    add_check({"privilege-escalation", "sudo-command", Severity::High, 35,
               "Privilege elevation command detected",
               "Run tools with the least privilege required", {}, {}, false},
              {"SUDO", "SU", "RUNAS"});
    add_check({"privilege-escalation", "system-modification", Severity::High, 35,
               "Setuid, service, registry or kernel module operation detected",
               "Do not allow system configuration changes from user input", {}, {}, false},
              {"UAC_BYPASS", "SETUID", "SERVICE_CONTROL", "REGISTRY_EDIT", "KERNEL_MODULE"});
    add_check({"file-system", "sensitive-file-access", Severity::Critical, 45,
               "Access to sensitive system files detected",
               "Restrict file access to the project directory", {}, {}, false},
              {"UNIX_SENSITIVE_FILES", "WINDOWS_SENSITIVE_FILES"});
    add_check({"file-system", "windows-device-names", Severity::Medium, 20,
               "Reserved Windows device name detected",
               "Avoid reserved device names in file names", {}, {}, false},
              {"WINDOWS_DEVICE_NAMES", "WINDOWS_DEVICE_NAME_VARIANTS"});
    add_check({"file-system", "windows-filename-edge-cases", Severity::Low, 10,
               "Trailing dot or whitespace in file name",
               "Strip trailing dots and spaces from file names", {}, {}, false},
              {"FILENAME_EDGE_CASES"});
    add_check({"file-system", "sensitive-extension", Severity::Low, 10,
               "Configuration, backup or executable file extension",
               "Confirm the file type is expected", {}, {}, false},
              {"CONFIG_EXTENSIONS", "BACKUP_EXTENSIONS", "EXECUTABLE_EXTENSIONS"});
    add_check({"network", "suspicious-protocol", Severity::Medium, 20,
               "Non-HTTP protocol scheme detected",
               "Allow only http and https URLs", {}, {}, false},
              {"SUSPICIOUS_PROTOCOLS"});
    add_check({"network", "internal-address", Severity::Low, 10,
               "Private or loopback address detected",
               "Block requests to internal networks", {}, {}, false},
              {"PRIVATE_IPS", "LOCALHOST"});
    add_check({"network", "sensitive-port", Severity::Low, 10,
               "Well-known service port detected",
               "Avoid exposing administrative service ports", {}, {}, false},
              {"SENSITIVE_PORTS"});
    add_check({"advanced-attack", "homograph-attack", Severity::High, 35,
               "Cyrillic or Greek lookalike characters detected",
               "Normalize identifiers to ASCII", {}, {CodepointClass::CyrillicHomograph, CodepointClass::GreekHomograph}, false},
              {});
    add_check({"advanced-attack", "bidirectional-text", Severity::High, 35,
               "Bidirectional override characters detected",
               "Remove bidirectional control characters", {}, {CodepointClass::Bidi}, false},
              {});
    add_check({"advanced-attack", "zero-width-characters", Severity::Medium, 20,
               "Zero-width characters detected",
               "Remove invisible characters", {}, {CodepointClass::ZeroWidth}, false},
              {});
    add_check({"advanced-attack", "prototype-pollution", Severity::High, 35,
               "Prototype pollution key detected",
               "Reject __proto__ and constructor keys", {}, {}, false},
              {"PROTOTYPE_POLLUTION"});
    add_check({"deserialization", "unsafe-deserialization", Severity::Critical, 45,
               "Serialized Java, pickle or PHP object detected",
               "Deserialize untrusted data only with type-checked formats", {}, {}, false},
              {"JAVA_SERIALIZED", "PYTHON_PICKLE", "PHP_SERIALIZED"});
    add_check({"deserialization", "dangerous-classes", Severity::Critical, 40,
               "Code execution or file inclusion function referenced",
               "Do not deserialize data that names executable classes", {}, {}, false},
              {"DANGEROUS_CLASSES"});
    add_check({"xxe", "external-entity", Severity::High, 35,
               "XML external entity declaration detected",
               "Disable external entity resolution in XML parsers", {}, {}, false},
              {"EXTERNAL_ENTITY", "DOCTYPE_EXTERNAL"});
    add_check({"xxe", "xml-bomb", Severity::High, 30,
               "Recursive entity expansion detected",
               "Limit entity expansion when parsing XML", {}, {}, false},
              {"XML_BOMB"});
    add_check({"ssti", "dangerous-template-injection", Severity::Critical, 40,
               "Template expression reaches process or interpreter internals",
               "Render templates in a sandbox without user-controlled expressions", {}, {}, false},
              {"JINJA2_INJECTION", "JINJA2_DANGEROUS", "TWIG_DANGEROUS", "FREEMARKER_DANGEROUS"});
    add_check({"ssti", "template-execution", Severity::High, 35,
               "Template expression executes code or walks object internals",
               "Restrict template access to plain data", {}, {}, false},
              {"TEMPLATE_EXECUTION", "TEMPLATE_OBJECT_ACCESS"});
    add_check({"ldap-injection", "ldap-filter-injection", Severity::High, 30,
               "LDAP filter metacharacters detected",
               "Escape LDAP filter characters before building queries", {}, {}, false},
              {"LDAP_FILTER_INJECTION"});
    add_check({"ldap-injection", "ldap-attribute-injection", Severity::Medium, 20,
               "LDAP attribute assignment detected",
               "Validate LDAP attribute names and values", {}, {}, false},
              {"LDAP_DANGEROUS_ATTRIBUTES"});
    add_check({"xpath-injection", "xpath-injection", Severity::High, 30,
               "XPath boolean injection detected",
               "Bind XPath variables instead of concatenating input", {}, {}, false},
              {"XPATH_OPERATORS", "XPATH_AND_OR"});
    add_check({"xpath-injection", "xpath-function-abuse", Severity::Medium, 20,
               "XPath function call detected",
               "Reject function calls in XPath input", {}, {}, false},
              {"XPATH_FUNCTIONS"});
    add_check({"expression-injection", "dangerous-el-injection", Severity::Critical, 40,
               "Expression language reaches runtime or system classes",
               "Never evaluate expression language built from input", {}, {}, false},
              {"JSP_EL_DANGEROUS", "SPRING_EL_DANGEROUS", "OGNL_DANGEROUS"});
    add_check({"expression-injection", "el-execution", Severity::Critical, 40,
               "Expression language execution or reflection detected",
               "Disable reflection and process access in expression evaluators", {}, {}, false},
              {"EL_EXECUTION", "EL_REFLECTION"});
    add_check({"csv-injection", "formula-injection", Severity::Medium, 20,
               "Spreadsheet formula prefix detected",
               "Prefix exported cells that start with = + - or @", {}, {}, false},
              {"FORMULA_STARTERS"});
    add_check({"csv-injection", "dangerous-csv-functions", Severity::High, 30,
               "Spreadsheet network function or DDE payload detected",
               "Block HYPERLINK, WEBSERVICE and DDE payloads in exports", {}, {}, false},
              {"CSV_DANGEROUS_FUNCTIONS", "DDE_INJECTION"});
}

void PatternCatalog::load_disclosure_rules(){
    using S = RedactionStrategy;
    using C = DisclosureCategory;
    // value of a key=value pair; never re-matches an existing placeholder
    const std::string V = R"((?!\*\*\*)[^\s,;}]{1,256})";
    const std::string SEP = R"([=:]\s{0,8})";

    add_disclosure(C::Injection, "ansi-escape", R"(\x1b\[[0-9;?]{0,32}[A-Za-z])", Severity::Medium, S::Delete, false);
    add_disclosure(C::Injection, "html-tag", R"(<[^<>]{0,512}>)", Severity::Medium, S::Delete);
    add_disclosure(C::Injection, "javascript-url", R"(javascript:[^;\s]{0,256})", Severity::Medium, S::Delete);
    add_disclosure(C::Injection, "alert-call", R"(\balert\s{0,8}\([^)]{0,256}\))", Severity::Medium, S::Delete);
    add_disclosure(C::Injection, "eval-call", R"(\beval\s{0,8}\([^)]{0,256}\))", Severity::Medium, S::Delete);
    add_disclosure(C::Injection, "event-handler",
                   R"(\bon[a-z]{2,32}\s{0,8}=\s{0,8}(?:"[^"]{0,256}"|'[^']{0,256}'|[^\s>]{1,256}))", Severity::Medium, S::Delete);
    add_disclosure(C::Injection, "control-chars", R"([\x00-\x1F\x7F])", Severity::Low, S::Delete, false);

    add_disclosure(C::ApiKey, "API_KEY", R"(API_KEY[=:-])" + V, Severity::Critical, S::KeyValue, false, true);
    add_disclosure(C::ApiKey, "TOKEN", R"(TOKEN[=:-])" + V, Severity::Critical, S::KeyValue, false, true);
    add_disclosure(C::ApiKey, "SECRET", R"(SECRET[=:-])" + V, Severity::Critical, S::KeyValue, false, true);
    add_disclosure(C::ApiKey, "ACCESS_KEY", R"(ACCESS_KEY[=:-])" + V, Severity::Critical, S::KeyValue, false, true);
    add_disclosure(C::ApiKey, "api-key", R"(api[_-]?key[0-9_]{0,8})" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "secret-access-key", R"(secret[_-]?access[_-]?key[0-9_]{0,8})" + SEP + V,
                   Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "access-key", R"(access[_-]?key[0-9_]{0,8})" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "authorization", R"(authorization\s{0,8}[=:]\s{0,8}(?:bearer|basic)\s{1,8})" + V,
                   Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "bearer", R"(\bbearer\s{1,8}(?!\*\*\*)[A-Za-z0-9._~+/=-]{8,512})",
                   Severity::Critical, S::Fixed, true, false, "Bearer ***");
    add_disclosure(C::ApiKey, "oauth-token", R"((?:access|refresh|jwt|id)[_-]?token)" + SEP + V,
                   Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "token", R"(token)" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "cloud-key",
                   R"((?:aws[_-]?access[_-]?key[_-]?id|aws[_-]?secret[_-]?access[_-]?key|gcp[_-]?(?:api[_-]?)?key|azure[_-]?(?:key|secret|client[_-]?secret)))" + SEP + V,
                   Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::ApiKey, "quoted-token", R"(['"](?:sk|pk|tok|key|secret)-[a-zA-Z0-9_-]{1,256}['"])",
                   Severity::Critical, S::KeyValue);
    add_disclosure(C::ApiKey, "json-api-key",
                   R"("[A-Za-z0-9_]{0,64}[Aa][Pp][Ii][_-]?[Kk][Ee][Yy][A-Za-z0-9_]{0,64}"\s{0,8}:\s{0,8}"(?!\*\*\*)[^"]{1,512}")",
                   Severity::Critical, S::KeyValue, false);

    add_disclosure(C::Password, "password",
                   R"((?:password|passwd|pwd|pass|secret)[0-9_]{0,8})" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::Password, "private-key",
                   R"((?:secret|private|cert(?:ificate)?|ssh|gpg)[_-]?key)" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::Password, "auth-token",
                   R"((?:auth|session|csrf)[_-]?token)" + SEP + V, Severity::Critical, S::KeyValue, true, true);
    add_disclosure(C::Password, "pem-block",
                   R"(-----BEGIN [A-Z ]{0,32}PRIVATE KEY-----[\s\S]{0,4096}?-----END [A-Z ]{0,32}PRIVATE KEY-----)",
                   Severity::Critical, S::Fixed, false, false, "[PRIVATE KEY]");

    add_disclosure(C::DatabaseUrl, "credentialed-url",
                   R"(\b(?:mongodb|mysql|postgres|postgresql|redis|sqlite|oracle|mssql)(?:\+srv)?://[^\s:@/]{1,128}:[^\s@/]{1,256}@[^\s/,;]{1,256})",
                   Severity::Critical, S::Connection);
    add_disclosure(C::DatabaseUrl, "database-url",
                   R"(\b(?:mongodb|mysql|postgres|postgresql|redis|sqlite|oracle|mssql)(?:\+srv)?://(?!\*\*\*)[^\s/@,;]{1,256})",
                   Severity::High, S::Connection);
    add_disclosure(C::DatabaseUrl, "connection-string",
                   R"(connection[_-]?string)" + SEP + R"((?!\*\*\*)[^\s,}]{1,512})", Severity::Critical, S::KeyValue);
    add_disclosure(C::DatabaseUrl, "database-setting",
                   R"(\b(?:database[_-]?url|db[_-]?url|database|db[_-]?(?:password|pass|pwd)|db[_-]?user(?:name)?|host|user|port))" + SEP + V,
                   Severity::High, S::KeyValue, true, true);

    add_disclosure(C::FilePath, "mac-home", R"(/Users/[^/\s]{1,128})", Severity::Medium, S::UserDirectory, false);
    add_disclosure(C::FilePath, "windows-home", R"(C:([\\/]{1,2})Users([\\/]{1,2})[^\\/\s]{1,128})", Severity::Medium, S::UserDirectory);
    add_disclosure(C::FilePath, "linux-home", R"(/home/[^/\s]{1,128})", Severity::Medium, S::UserDirectory, false);
    add_disclosure(C::FilePath, "credential-file",
                   R"([^/\\\s]{0,128}(?:config|credential|secret|key|token|password)[^/\\\s]{0,128}\.(?:json|ya?ml|env|ini|conf|cfg|pem|key|p12|pfx|txt)\b)",
                   Severity::High, S::SensitiveFile);
    add_disclosure(C::FilePath, "secret-dotfile",
                   R"([/\\]\.(?:env|ssh|aws|npmrc|netrc|pgpass|git-credentials|docker)(?![A-Za-z])[^\s]{0,128})",
                   Severity::High, S::SensitiveFile);
    add_disclosure(C::FilePath, "system-credential-file", R"(/(?:etc/shadow|etc/passwd|var/log/auth\.log))",
                   Severity::High, S::SensitiveFile, false);
    add_disclosure(C::FilePath, "windows-sam", R"(C:[/\\]Windows[/\\]System32[/\\]config[/\\]SAM)", Severity::High, S::SensitiveFile);

    add_disclosure(C::NetworkInfo, "ipv4", R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", Severity::Medium, S::Network, false);
    add_disclosure(C::NetworkInfo, "ipv6-full", R"(\b(?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}\b)", Severity::Medium,
                   S::Fixed, false, false, "[IPv6]");
    add_disclosure(C::NetworkInfo, "ipv6-compressed",
                   R"(\b(?:[0-9a-fA-F]{1,4}:){1,6}:(?:[0-9a-fA-F]{1,4}(?::[0-9a-fA-F]{1,4}){0,5})?)", Severity::Medium,
                   S::Fixed, false, false, "[IPv6]");
    add_disclosure(C::NetworkInfo, "port-setting", R"(\bport[=:]\s{0,8}\d{1,5})", Severity::Low, S::Network);
    add_disclosure(C::NetworkInfo, "host-setting", R"(\b(?:hostname|host|server))" + SEP + V, Severity::Medium, S::Network, true, true);
    add_disclosure(C::NetworkInfo, "port-suffix", R"(:\d{2,5}\b(?![\d.]))", Severity::Low, S::Network, false);
    add_disclosure(C::NetworkInfo, "localhost-port", R"(\blocalhost:\d{1,5})", Severity::Low, S::Network);

    add_disclosure(C::PersonalInfo, "email",
                   R"(\b[A-Za-z0-9._%+-]{1,64}@(?:[A-Za-z0-9-]{1,63}\.){1,8}[A-Za-z]{2,24}\b)", Severity::High,
                   S::Fixed, false, false, "***@***.***");
    add_disclosure(C::PersonalInfo, "card-number", R"(\b(?:\d{4}[ -]?){3}\d{4}\b)", Severity::Critical,
                   S::Fixed, false, false, "****-****-****-****");
    add_disclosure(C::PersonalInfo, "long-number", R"(\b\d{13,19}\b)", Severity::High, S::Fixed, false, false, "****");
    add_disclosure(C::PersonalInfo, "ssn", R"(\b\d{3}-\d{2}-\d{4}\b)", Severity::Critical, S::Fixed, false, false, "***-**-****");
    add_disclosure(C::PersonalInfo, "ssn-compact", R"(\b\d{9}\b)", Severity::High, S::Fixed, false, false, "***-**-****");
    add_disclosure(C::PersonalInfo, "phone",
                   R"((?:\+?1[ .-]?)?\(?\b\d{3}\)?[ .-]\d{3}[ .-]\d{4}\b)", Severity::High, S::Fixed, false, false, "***-***-****");
    add_disclosure(C::PersonalInfo, "user-identity",
                   R"(\b(?:username|user|login|(?:employee|customer|client)[_-]?id))" + SEP + V, Severity::Medium,
                   S::KeyValue, true, true);
}

bool PatternCatalog::in_class(char32_t cp, CodepointClass c) const {
    switch(c){
        case CodepointClass::CyrillicHomograph: return in_ranges(cp, kCyrillic);
        case CodepointClass::GreekHomograph: return in_ranges(cp, kGreek);
        case CodepointClass::Bidi: return in_ranges(cp, kBidi);
        case CodepointClass::ZeroWidth: return in_ranges(cp, kZeroWidth);
        case CodepointClass::DotLookalike: return in_ranges(cp, kDotLookalike);
        case CodepointClass::SlashLookalike: return in_ranges(cp, kSlashLookalike);
        case CodepointClass::NullByte: return in_ranges(cp, kNull);
    }
    return false;
}

bool PatternCatalog::has_codepoint(const std::string& s, CodepointClass c) const {
    if(c == CodepointClass::NullByte) return s.find('\0') != std::string::npos;
    for(const auto& cp : utils::decode_utf8(s)) if(in_class(cp.value, c)) return true;
    return false;
}

std::string PatternCatalog::strip_codepoints(const std::string& s, CodepointClass c) const {
    std::string out;
    out.reserve(s.size());
    for(const auto& cp : utils::decode_utf8(s)){
        if(!in_class(cp.value, c)) out.append(s, cp.offset, cp.length);
    }
    return out;
}

std::string PatternCatalog::fold_homographs(const std::string& s) const {
    std::string out;
    out.reserve(s.size());
    for(const auto& cp : utils::decode_utf8(s)){
        bool cyrillic = in_class(cp.value, CodepointClass::CyrillicHomograph);
        if(!cyrillic && !in_class(cp.value, CodepointClass::GreekHomograph)){
            out.append(s, cp.offset, cp.length);
            continue;
        }
        char32_t key = cp.value;
        if(cyrillic && key >= 0x0410 && key <= 0x042F) key += 0x20;
        for(const auto& m : kHomographMap){
            if(m.from == key){ out.push_back(m.to); break; }
        }
    }
    return out;
}

bool PatternCatalog::has_lookalike_traversal(const std::string& s) const {
    auto cps = utils::decode_utf8(s);
    for(size_t i = 0; i < cps.size(); ++i) if(lookalike_traversal_at(*this, cps, i)) return true;
    return false;
}

std::string PatternCatalog::strip_lookalike_traversal(const std::string& s) const {
    auto cps = utils::decode_utf8(s);
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while(i < cps.size()){
        size_t n = lookalike_traversal_at(*this, cps, i);
        if(n){ i += n; continue; }
        out.append(s, cps[i].offset, cps[i].length);
        ++i;
    }
    return out;
}

bool PatternCatalog::is_project_name_char(char32_t cp) const {
    if((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9')) return true;
    if(cp == U'-' || cp == U'_' || cp == U'.') return true;
    return in_ranges(cp, kProjectNameExtra);
}

}
