#pragma once
#include "../core/Config.h"
#include "../core/ContextValue.h"
#include "../core/Severity.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace secscrub {

struct SensitiveContextDetection {
    std::string property_path; // "db.password", "users[0]"
    std::string sensitive_type;
    std::string hint;
    Severity severity = Severity::Medium;
};

struct SanitizedErrorContext {
    std::string error_id;
    nlohmann::ordered_json context = nlohmann::ordered_json::object();
    std::optional<std::string> code;
    std::optional<std::string> timestamp;
    std::vector<std::string> redacted_properties;
    std::vector<std::string> security_warnings;
    bool had_sensitive_data = false;
    std::map<std::string, std::string> redaction_hints;
    std::vector<SensitiveContextDetection> detections;
};

SanitizedErrorContext sanitize_error_context(const ErrorInfo& error,
                                             const ContextValue& additional_context = ContextValue::object(),
                                             const ErrorContextConfig& config = {});

struct ForwardedError {
    std::string error_id;
    std::string message;
    std::string type;
    std::string timestamp;
    nlohmann::ordered_json context = nlohmann::ordered_json::object();
    Severity severity = Severity::Low; // low, medium or high
    bool had_sensitive_data = false;
    size_t redacted_count = 0;
    std::vector<std::string> security_warnings;

    nlohmann::ordered_json to_json() const;
    std::string serialize() const;
};

constexpr size_t MAX_FORWARDED_WARNINGS = 10;
constexpr int FORWARDING_MESSAGE_LENGTH = 300;

// Partial redaction, 500-byte context limit, timestamps on.
ErrorContextConfig forwarding_context_config();

// Telemetry payload whose serialized size stays within config.max_forwarding_size.
ForwardedError create_safe_error_for_forwarding(const ErrorInfo& error,
                                                const ContextValue& context = ContextValue::object(),
                                                const ErrorContextConfig& config = forwarding_context_config());

// Dangerous keys (__proto__, constructor, prototype) removed recursively; a cycle
// collapses to an empty object and is reported in warnings.
ContextValue strip_dangerous_keys(const ContextValue& value, std::vector<std::string>& warnings);

// Recursive leaf classification by property path and value shape.
std::vector<SensitiveContextDetection> detect_sensitive_context(const nlohmann::ordered_json& context,
                                                                const ErrorContextConfig& config = {});

// ERR_<year>_<8 hex> (secure) or ERR_<millis>_<6 base36>
std::string generate_error_id(const std::string& name, size_t message_length, bool secure);

}
