#include "ContextRedactor.h"
#include "MessageRedactor.h"
#include "../core/ConfigValidator.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <openssl/rand.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <regex>
#include <unordered_set>

namespace secscrub {

namespace {

using json = nlohmann::ordered_json;

const char* const kDangerousKeys[] = {"__proto__", "constructor", "prototype"};
const char* const kPriorityKeys[] = {"timestamp", "level", "operation", "component", "status"};

constexpr size_t ANALYZED_VALUE_LIMIT = 10000;
constexpr size_t PRE_TRUNCATE_LENGTH = 200;
constexpr size_t POST_TRUNCATE_LENGTH = 100;
constexpr size_t FORWARD_TRUNCATE_LENGTH = 50;
constexpr size_t MAX_WARNING_LENGTH = 200;
constexpr auto SLOW_SANITIZATION = std::chrono::milliseconds(100);

bool is_dangerous_key(const std::string& k){
    return std::any_of(std::begin(kDangerousKeys), std::end(kDangerousKeys), [&](const char* d){ return k == d; });
}

struct ShapeRules {
    std::regex path_secret{R"(password|passwd|pwd|secret|key)", std::regex::ECMAScript | std::regex::icase};
    std::regex value_secret{R"((?:password|secret)[=:]\s{0,8}(?!\*\*\*)\S)", std::regex::ECMAScript | std::regex::icase};
    std::regex path_token{R"(api[_-]?key|token|bearer|authorization)", std::regex::ECMAScript | std::regex::icase};
    std::regex value_token{R"(\b(?:sk|pk)-[A-Za-z0-9_-]{8}|[A-Za-z0-9]{32}|\bbearer\s{1,8}[A-Za-z0-9._~+/=-]{8})",
                           std::regex::ECMAScript | std::regex::icase};
    std::regex email{R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24})"};
    std::regex file_path{R"(^/|^[A-Z]:[\\/]|/home/|/Users/|\\Users\\)"};
    std::regex credential_url{R"(https?://[^:/\s@]{1,256}:[^@\s]{1,256}@)", std::regex::ECMAScript | std::regex::icase};
    std::regex db_scheme{R"((?:mongodb|mysql|postgres|redis)://)", std::regex::ECMAScript | std::regex::icase};
    std::regex ipv4{R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)"};
};

const ShapeRules& shape_rules(){
    static const ShapeRules rules;
    return rules;
}

struct Detector {
    const ErrorContextConfig& cfg;
    std::vector<std::regex> custom;
    std::vector<SensitiveContextDetection>& out;

    void analyze_string(const std::string& raw, const std::string& path){
        const ShapeRules& r = shape_rules();
        const std::string value = utils::utf8_prefix(raw, ANALYZED_VALUE_LIMIT);
        if(std::regex_search(path, r.path_secret) || std::regex_search(value, r.value_secret))
            out.push_back({path, "password/secret", "Authentication credential", Severity::Critical});
        if(std::regex_search(path, r.path_token) || std::regex_search(value, r.value_token))
            out.push_back({path, "api-key/token", "API authentication token", Severity::Critical});
        if(std::regex_search(value, r.email))
            out.push_back({path, "personal-email", "Personal email address", Severity::High});
        if(std::regex_search(value, r.file_path))
            out.push_back({path, "file-path", "File system path", Severity::Medium});
        if(std::regex_search(value, r.credential_url))
            out.push_back({path, "url-with-credentials", "URL with embedded credentials", Severity::Critical});
        std::smatch m;
        if(std::regex_search(value, m, r.db_scheme)){
            size_t after = static_cast<size_t>(m.position(0) + m.length(0));
            size_t colon = value.find(':', after);
            if(colon != std::string::npos && value.find('@', colon) != std::string::npos)
                out.push_back({path, "database-connection", "Database connection string", Severity::Critical});
        }
        if(std::regex_search(value, r.ipv4))
            out.push_back({path, "ip-address", "IP address", Severity::Medium});
        for(const auto& re : custom){
            if(std::regex_search(value, re)){
                out.push_back({path, "custom-pattern", "Matched custom sensitive pattern", Severity::High});
                break;
            }
        }
    }

    void walk(const json& v, const std::string& path, int depth){
        if(depth > MAX_CONTEXT_DEPTH) return;
        if(v.is_string()){
            analyze_string(v.get_ref<const std::string&>(), path);
        } else if(v.is_number()){
            analyze_string(safe_dump(v), path);
        } else if(v.is_object()){
            if(depth > 0 && !cfg.sanitize_nested_objects) return;
            for(auto it = v.begin(); it != v.end(); ++it){
                walk(it.value(), path.empty() ? it.key() : path + "." + it.key(), depth + 1);
            }
        } else if(v.is_array()){
            size_t before = out.size();
            for(size_t i = 0; i < v.size(); ++i){
                std::string item_path = path + "[" + std::to_string(i) + "]";
                const json& item = v[i];
                if(item.is_object() || item.is_array()){
                    analyze_string(safe_dump(item), item_path);
                    if(cfg.sanitize_nested_objects) walk(item, item_path, depth + 1);
                } else if(item.is_string() || item.is_number()){
                    walk(item, item_path, depth + 1);
                }
            }
            if(out.size() > before){
                out.push_back({path, "sensitive-array", "Array contains sensitive elements", Severity::High});
            }
        }
    }
};

bool path_has_detection(const std::string& key, const std::vector<SensitiveContextDetection>& ds){
    for(const auto& d : ds) if(d.property_path == key) return true;
    return false;
}

const SensitiveContextDetection* detection_at(const std::string& path, const std::vector<SensitiveContextDetection>& ds){
    for(const auto& d : ds) if(d.property_path == path) return &d;
    return nullptr;
}

// Total byte length of top-level strings plus serialized length of everything else.
size_t estimate_size(const json& ctx){
    size_t total = 0;
    for(auto it = ctx.begin(); it != ctx.end(); ++it){
        total += it.value().is_string() ? it.value().get_ref<const std::string&>().size() : safe_dump(it.value()).size();
    }
    return total;
}

bool truncate_strings(json& v, size_t limit, const std::string& suffix, int depth = 0){
    if(depth > MAX_CONTEXT_DEPTH) return false;
    if(v.is_string()){
        const std::string& s = v.get_ref<const std::string&>();
        if(s.size() <= limit) return false;
        v = utils::utf8_prefix(s, limit) + suffix;
        return true;
    }
    bool changed = false;
    if(v.is_structured()){
        for(auto& child : v) changed |= truncate_strings(child, limit, suffix, depth + 1);
    }
    return changed;
}

class PartialRedactor {
public:
    PartialRedactor(const std::vector<SensitiveContextDetection>& ds, SanitizedErrorContext& res, bool hints)
        : ds_(ds), res_(res), hints_(hints) {}

    json sanitize(const json& v, const std::string& path){
        if(v.is_object()){
            json out = json::object();
            for(auto it = v.begin(); it != v.end(); ++it){
                std::string child = path + "." + it.key();
                if(const auto* d = detection_at(child, ds_)){
                    redact(child, d->hint);
                    continue;
                }
                out[it.key()] = sanitize(it.value(), child);
            }
            return out;
        }
        if(v.is_array()){
            json out = json::array();
            for(size_t i = 0; i < v.size(); ++i){
                std::string child = path + "[" + std::to_string(i) + "]";
                if(detection_at(child, ds_)) out.push_back("[redacted]");
                else out.push_back(sanitize(v[i], child));
            }
            return out;
        }
        return v;
    }

    void redact(const std::string& path, const std::string& hint){
        res_.redacted_properties.push_back(path);
        if(hints_) res_.redaction_hints[path] = hint.empty() ? "Sensitive content detected" : hint;
    }

private:
    const std::vector<SensitiveContextDetection>& ds_;
    SanitizedErrorContext& res_;
    bool hints_;
};

uint32_t random_u32(){
    uint32_t v = 0;
    if(RAND_bytes(reinterpret_cast<unsigned char*>(&v), sizeof(v)) != 1){
        Logger::instance().debug("context: RAND_bytes unavailable, using std::random_device");
        std::random_device rd;
        v = rd();
    }
    return v;
}

std::string cap_warning(const std::string& w){
    return w.size() > MAX_WARNING_LENGTH ? utils::utf8_prefix(w, MAX_WARNING_LENGTH) + "..." : w;
}

std::vector<std::string> cap_warnings(const std::vector<std::string>& all){
    std::vector<std::string> out;
    for(size_t i = 0; i < all.size() && i < MAX_FORWARDED_WARNINGS; ++i) out.push_back(cap_warning(all[i]));
    if(all.size() > MAX_FORWARDED_WARNINGS){
        out.push_back("... and " + std::to_string(all.size() - MAX_FORWARDED_WARNINGS) +
                      " more security warnings (truncated for telemetry)");
    }
    return out;
}

ContextValue strip_rec(const ContextValue& v, std::unordered_set<const void*>& ancestors,
                       std::vector<std::string>& warnings, int depth){
    if(!v.is_container()) return v;
    if(ancestors.count(v.identity())){
        warnings.push_back("Circular reference detected in context");
        return ContextValue::object();
    }
    if(depth >= MAX_CONTEXT_DEPTH){
        warnings.push_back("Context nesting exceeds maximum depth");
        return ContextValue("[Max depth exceeded]");
    }
    ancestors.insert(v.identity());
    ContextValue out = v.is_object() ? ContextValue::object() : ContextValue::array();
    if(v.is_object()){
        for(const auto& m : v.members()){
            if(is_dangerous_key(m.first)) continue;
            out.set(m.first, strip_rec(m.second, ancestors, warnings, depth + 1));
        }
    } else {
        for(const auto& item : v.items()) out.push(strip_rec(item, ancestors, warnings, depth + 1));
    }
    ancestors.erase(v.identity());
    return out;
}

} // namespace

ContextValue strip_dangerous_keys(const ContextValue& value, std::vector<std::string>& warnings){
    std::unordered_set<const void*> ancestors;
    return strip_rec(value, ancestors, warnings, 0);
}

std::vector<SensitiveContextDetection> detect_sensitive_context(const json& context, const ErrorContextConfig& config){
    std::vector<SensitiveContextDetection> out;
    std::vector<PatternWarning> pattern_warnings;
    Detector d{config, ConfigValidator::compile_patterns(config.custom_context_patterns, pattern_warnings), out};
    d.walk(context, "", 0);
    return out;
}

std::string generate_error_id(const std::string& name, size_t message_length, bool secure){
    using namespace std::chrono;
    auto now = system_clock::now();
    long long ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
    uint32_t rnd = random_u32();
    char buf[32];
    if(secure){
        // content-free seed: the message itself never feeds the id
        std::string seed = name + "-" + std::to_string(message_length) + "-" + std::to_string(ms) + "-" + std::to_string(rnd);
        uint32_t h = 0;
        for(unsigned char c : seed) h = (h << 5) - h + c;
        int32_t signed_h = static_cast<int32_t>(h);
        uint32_t magnitude = signed_h < 0 ? 0u - static_cast<uint32_t>(signed_h) : static_cast<uint32_t>(signed_h);
        std::time_t secs = system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&secs, &tm);
        std::snprintf(buf, sizeof(buf), "ERR_%04d_%08X", tm.tm_year + 1900, magnitude);
        return buf;
    }
    static const char digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::string suffix(6, '0');
    uint32_t r = rnd;
    for(int i = 5; i >= 0; --i){ suffix[i] = digits[r % 36]; r /= 36; }
    return "ERR_" + std::to_string(ms) + "_" + suffix;
}

SanitizedErrorContext sanitize_error_context(const ErrorInfo& error, const ContextValue& additional_context,
                                             const ErrorContextConfig& config){
    auto started = std::chrono::steady_clock::now();
    ErrorContextConfig cfg = config;
    ConfigValidator::normalize(cfg);

    SanitizedErrorContext res;
    const std::string name = error.name.empty() ? "Error" : error.name;
    const std::string message = error.message.empty() ? "Unknown error" : error.message;
    res.error_id = generate_error_id(name, error.message.size(), cfg.generate_secure_ids);

    const std::string safe_message = sanitize_error_message(message);
    const bool message_changed = safe_message != message;

    ContextValue raw = ContextValue::object();
    raw.set("message", safe_message);
    raw.set("name", name);
    for(const auto& m : error.properties.members()){
        if(m.first == "message" || m.first == "name" || m.first == "stack") continue;
        raw.set(m.first, m.second);
    }
    for(const auto& m : additional_context.members()) raw.set(m.first, m.second);

    std::vector<std::string> warnings;
    json ctx = context_to_json(strip_dangerous_keys(raw, warnings), &warnings);
    for(const auto& w : warnings) res.security_warnings.push_back(w);

    if(cfg.preserve_error_codes && error.code){
        res.code = *error.code;
        ctx["code"] = *error.code;
    }
    if(cfg.preserve_timestamps){
        res.timestamp = iso_timestamp(std::chrono::system_clock::now());
        ctx["timestamp"] = *res.timestamp;
    }

    const size_t max_len = static_cast<size_t>(cfg.max_context_length);
    if(estimate_size(ctx) > max_len * 3){
        res.security_warnings.push_back("Large context detected - applying size limits for security");
        for(auto it = ctx.begin(); it != ctx.end(); ++it){
            if(truncate_strings(it.value(), PRE_TRUNCATE_LENGTH, "...[truncated]") && cfg.include_context_hints)
                res.redaction_hints[it.key()] = "Long content truncated for security";
        }
    }

    res.detections = detect_sensitive_context(ctx, cfg);
    const auto& ds = res.detections;

    json out = json::object();
    PartialRedactor partial(ds, res, cfg.include_context_hints);
    for(auto it = ctx.begin(); it != ctx.end(); ++it){
        const std::string& key = it.key();
        switch(cfg.redaction_level){
            case RedactionLevel::None:
                out[key] = it.value();
                break;
            case RedactionLevel::Full: {
                bool allowed = std::any_of(cfg.allowed_properties.begin(), cfg.allowed_properties.end(),
                                           [&](const std::string& p){ return p == key || p == "*"; });
                if(allowed) out[key] = it.value();
                else partial.redact(key, "Property redacted (full redaction mode)");
                break;
            }
            case RedactionLevel::Partial:
                if(path_has_detection(key, ds)) partial.redact(key, detection_at(key, ds)->hint);
                else out[key] = partial.sanitize(it.value(), key);
                break;
        }
    }

    res.had_sensitive_data = !ds.empty() || message_changed;
    for(const auto& d : ds){
        if(d.severity == Severity::High || d.severity == Severity::Critical)
            res.security_warnings.push_back(d.sensitive_type + " detected in " + d.property_path);
    }

    if(safe_dump(out).size() > max_len){
        res.security_warnings.push_back("Context size exceeded limits after sanitization");
        for(auto it = out.begin(); it != out.end(); ++it){
            if(!truncate_strings(it.value(), POST_TRUNCATE_LENGTH, "...[size-limited]") || !cfg.include_context_hints) continue;
            auto hint = res.redaction_hints.find(it.key());
            if(hint == res.redaction_hints.end()) res.redaction_hints[it.key()] = "Content size limited";
            else hint->second += " (size limited)";
        }
    }
    res.context = std::move(out);

    auto elapsed = std::chrono::steady_clock::now() - started;
    if(elapsed > SLOW_SANITIZATION){
        res.security_warnings.push_back("Context sanitization exceeded time budget");
        Logger::instance().warn("context: sanitization took " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()) + "ms");
    }
    return res;
}

ErrorContextConfig forwarding_context_config(){
    ErrorContextConfig cfg;
    cfg.redaction_level = RedactionLevel::Partial;
    cfg.max_context_length = 500;
    cfg.preserve_timestamps = true;
    return cfg;
}

json ForwardedError::to_json() const {
    json j = json::object();
    j["errorId"] = error_id;
    j["message"] = message;
    j["type"] = type;
    j["timestamp"] = timestamp;
    j["context"] = context;
    j["severity"] = severity_to_string(severity);
    j["metadata"] = {
        {"hadSensitiveData", had_sensitive_data},
        {"redactedCount", redacted_count},
        {"securityWarnings", security_warnings},
    };
    return j;
}

std::string ForwardedError::serialize() const {
    return safe_dump(to_json());
}

static Severity forwarding_severity(const ForwardedError& fe){
    if(fe.type == "SecurityError" || utils::contains(utils::to_lower(fe.message), "security")) return Severity::High;
    if(fe.had_sensitive_data || !fe.security_warnings.empty()) return Severity::Medium;
    return Severity::Low;
}

ForwardedError create_safe_error_for_forwarding(const ErrorInfo& error, const ContextValue& context,
                                                const ErrorContextConfig& config){
    ErrorContextConfig cfg = config;
    ConfigValidator::normalize(cfg);
    SanitizedErrorContext sanitized = sanitize_error_context(error, context, cfg);

    ErrorSanitizationConfig msg_cfg;
    msg_cfg.max_message_length = FORWARDING_MESSAGE_LENGTH;

    ForwardedError fe;
    fe.error_id = sanitized.error_id;
    fe.message = sanitize_error_message(error.message.empty() ? "Unknown error" : error.message, msg_cfg);
    msg_cfg.max_message_length = 100;
    fe.type = sanitize_error_message(error.name.empty() ? "Error" : error.name, msg_cfg);
    fe.timestamp = sanitized.timestamp ? *sanitized.timestamp : iso_timestamp(std::chrono::system_clock::now());
    fe.had_sensitive_data = sanitized.had_sensitive_data;
    fe.redacted_count = sanitized.redacted_properties.size();

    std::vector<std::string> warnings = sanitized.security_warnings;
    fe.security_warnings = cap_warnings(warnings);
    fe.severity = forwarding_severity(fe);
    fe.context = sanitized.context;

    const size_t cap = static_cast<size_t>(cfg.max_forwarding_size);
    if(fe.serialize().size() <= cap) return fe;

    warnings.push_back("Payload size exceeded telemetry limits - applying aggressive reduction");
    fe.security_warnings = cap_warnings(warnings);
    fe.severity = forwarding_severity(fe);
    fe.context = json::object();

    auto try_add = [&](const std::string& key, const json& value){
        fe.context[key] = value;
        if(fe.serialize().size() <= cap) return true;
        if(value.is_string()){
            fe.context[key] = utils::utf8_prefix(value.get_ref<const std::string&>(), FORWARD_TRUNCATE_LENGTH) + "...[truncated]";
            if(fe.serialize().size() <= cap) return true;
        }
        fe.context.erase(key);
        return false;
    };

    for(const char* key : kPriorityKeys){
        if(sanitized.context.contains(key)) try_add(key, sanitized.context[key]);
    }
    for(auto it = sanitized.context.begin(); it != sanitized.context.end(); ++it){
        if(fe.context.contains(it.key())) continue;
        if(std::any_of(std::begin(kPriorityKeys), std::end(kPriorityKeys), [&](const char* p){ return it.key() == p; })) continue;
        if(!try_add(it.key(), it.value())) break;
    }
    if(fe.serialize().size() <= cap) return fe;

    // the context is empty now; shorten the fixed fields until the payload fits
    auto shrink = [&](std::string& field){
        const std::string suffix = "...";
        size_t size = fe.serialize().size();
        while(size > cap && !field.empty()){
            size_t excess = size - cap + suffix.size();
            field = excess >= field.size() ? std::string() : utils::utf8_prefix(field, field.size() - excess) + suffix;
            size = fe.serialize().size();
        }
    };
    for(auto& w : fe.security_warnings){
        if(w.size() > FORWARD_TRUNCATE_LENGTH) w = utils::utf8_prefix(w, FORWARD_TRUNCATE_LENGTH) + "...";
    }
    while(!fe.security_warnings.empty() && fe.serialize().size() > cap) fe.security_warnings.pop_back();
    shrink(fe.message);
    shrink(fe.type);
    shrink(fe.timestamp);
    if(fe.serialize().size() > cap){
        Logger::instance().warn("forward: payload metadata alone exceeds " + std::to_string(cap) + " bytes");
    }
    return fe;
}

}
