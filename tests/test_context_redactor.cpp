#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/sanitizers/ContextRedactor.h"
#include <algorithm>
#include <regex>

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::EndsWith;

namespace secscrub {

using json = nlohmann::ordered_json;

class ContextRedactorTest : public ::testing::Test {
protected:
    ContextRedactorTest() {
        error_.message = "boom";
    }

    static bool has_detection(const std::vector<SensitiveContextDetection>& ds, const std::string& path, const std::string& type){
        return std::any_of(ds.begin(), ds.end(), [&](const SensitiveContextDetection& d){
            return d.property_path == path && d.sensitive_type == type;
        });
    }

    static std::string prose(size_t words){
        std::string s;
        for(size_t i = 0; i < words; ++i) s += "lorem ";
        return s;
    }

    ErrorInfo error_;
    ContextValue ctx_ = ContextValue::object();
};

TEST_F(ContextRedactorTest, ErrorIdFormats) {
    EXPECT_TRUE(std::regex_match(generate_error_id("Error", 4, true), std::regex(R"(ERR_\d{4}_[0-9A-F]{8})")));
    EXPECT_TRUE(std::regex_match(generate_error_id("Error", 4, false), std::regex(R"(ERR_\d+_[0-9A-Z]{6})")));
}

TEST_F(ContextRedactorTest, CleanContextPassesThrough) {
    ctx_.set("operation", "save");
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_FALSE(r.had_sensitive_data);
    EXPECT_TRUE(r.redacted_properties.empty());
    EXPECT_EQ(r.context["message"], "boom");
    EXPECT_EQ(r.context["name"], "Error");
    EXPECT_EQ(r.context["operation"], "save");
    ASSERT_TRUE(r.timestamp.has_value());
    EXPECT_TRUE(std::regex_match(*r.timestamp, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));
    EXPECT_EQ(r.context["timestamp"], *r.timestamp);
}

TEST_F(ContextRedactorTest, PasswordPropertyDropped) {
    ctx_.set("password", "x");
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_TRUE(r.had_sensitive_data);
    EXPECT_FALSE(r.context.contains("password"));
    EXPECT_THAT(r.redacted_properties, Contains("password"));
    EXPECT_EQ(r.redaction_hints["password"], "Authentication credential");
    EXPECT_THAT(r.security_warnings, Contains("password/secret detected in password"));
}

TEST_F(ContextRedactorTest, NestedSecretDroppedSiblingsKept) {
    ContextValue db = ContextValue::object();
    db.set("host", "localhost").set("password", "hunter2");
    ctx_.set("db", db).set("op", "save");
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    ASSERT_TRUE(r.context.contains("db"));
    EXPECT_EQ(r.context["db"]["host"], "localhost");
    EXPECT_FALSE(r.context["db"].contains("password"));
    EXPECT_EQ(r.context["op"], "save");
    EXPECT_THAT(r.redacted_properties, Contains("db.password"));
}

TEST_F(ContextRedactorTest, MessageRedactionCountsAsSensitive) {
    error_.message = "login failed password=abc";
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_EQ(r.context["message"], "login failed password=***");
    EXPECT_TRUE(r.had_sensitive_data);
}

TEST_F(ContextRedactorTest, DangerousKeysStripped) {
    ContextValue polluted = ContextValue::object();
    polluted.set("isAdmin", true);
    ctx_.set("__proto__", polluted).set("constructor", "x").set("safe", 1);
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_FALSE(r.context.contains("__proto__"));
    EXPECT_FALSE(r.context.contains("constructor"));
    EXPECT_EQ(r.context["safe"], 1);
}

TEST_F(ContextRedactorTest, CircularContextCollapsed) {
    ContextValue loop = ContextValue::object();
    loop.set("self", loop);
    ctx_.set("loop", loop);
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_THAT(r.security_warnings, Contains("Circular reference detected in context"));
    EXPECT_EQ(r.context["loop"]["self"], json::object());
    loop.clear();
}

TEST_F(ContextRedactorTest, FullRedactionKeepsOnlyAllowedProperties) {
    ctx_.set("operation", "save").set("userId", "42");
    ErrorContextConfig cfg;
    cfg.redaction_level = RedactionLevel::Full;
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_TRUE(r.context.contains("operation"));
    EXPECT_TRUE(r.context.contains("timestamp"));
    EXPECT_FALSE(r.context.contains("message"));
    EXPECT_FALSE(r.context.contains("userId"));
    EXPECT_EQ(r.redaction_hints["userId"], "Property redacted (full redaction mode)");
}

TEST_F(ContextRedactorTest, WildcardAllowsEverythingInFullMode) {
    ctx_.set("userId", "42");
    ErrorContextConfig cfg;
    cfg.redaction_level = RedactionLevel::Full;
    cfg.allowed_properties = {"*"};
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_EQ(r.context["userId"], "42");
    EXPECT_TRUE(r.redacted_properties.empty());
}

TEST_F(ContextRedactorTest, NoRedactionStillReportsDetections) {
    ctx_.set("password", "x");
    ErrorContextConfig cfg;
    cfg.redaction_level = RedactionLevel::None;
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_EQ(r.context["password"], "x");
    EXPECT_TRUE(r.had_sensitive_data);
    EXPECT_TRUE(has_detection(r.detections, "password", "password/secret"));
}

TEST_F(ContextRedactorTest, ErrorCodeAndTimestampToggles) {
    error_.code = "E42";
    ErrorContextConfig cfg;
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_EQ(r.code, std::optional<std::string>("E42"));
    EXPECT_EQ(r.context["code"], "E42");

    cfg.preserve_error_codes = false;
    cfg.preserve_timestamps = false;
    r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_FALSE(r.code.has_value());
    EXPECT_FALSE(r.timestamp.has_value());
    EXPECT_FALSE(r.context.contains("code"));
    EXPECT_FALSE(r.context.contains("timestamp"));
}

TEST_F(ContextRedactorTest, LargeContextPreTruncated) {
    ctx_.set("blob", prose(1000));
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    EXPECT_THAT(r.security_warnings, Contains("Large context detected - applying size limits for security"));
    EXPECT_THAT(r.context["blob"].get<std::string>(), EndsWith("...[truncated]"));
    EXPECT_EQ(r.redaction_hints["blob"], "Long content truncated for security");
}

TEST_F(ContextRedactorTest, HintsCanBeDisabled) {
    ctx_.set("password", "x");
    ErrorContextConfig cfg;
    cfg.include_context_hints = false;
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_, cfg);
    EXPECT_THAT(r.redacted_properties, Contains("password"));
    EXPECT_TRUE(r.redaction_hints.empty());
}

TEST_F(ContextRedactorTest, DetectionShapes) {
    json ctx = json::parse(R"({
        "users": [{"email": "a@b.co"}],
        "ip": "10.0.0.1",
        "path": "/etc/app",
        "conn": "postgres://u:p@h/db",
        "url": "https://u:p@example.com",
        "key": "sk-abcdefgh12345",
        "count": 5
    })");
    auto ds = detect_sensitive_context(ctx);
    EXPECT_TRUE(has_detection(ds, "users[0]", "personal-email"));
    EXPECT_TRUE(has_detection(ds, "users[0].email", "personal-email"));
    EXPECT_TRUE(has_detection(ds, "users", "sensitive-array"));
    EXPECT_TRUE(has_detection(ds, "ip", "ip-address"));
    EXPECT_TRUE(has_detection(ds, "path", "file-path"));
    EXPECT_TRUE(has_detection(ds, "conn", "database-connection"));
    EXPECT_TRUE(has_detection(ds, "url", "url-with-credentials"));
    EXPECT_TRUE(has_detection(ds, "key", "api-key/token"));
    EXPECT_FALSE(std::any_of(ds.begin(), ds.end(), [](const SensitiveContextDetection& d){ return d.property_path == "count"; }));
}

TEST_F(ContextRedactorTest, CustomAndNestedDetectionSettings) {
    ErrorContextConfig cfg;
    cfg.custom_context_patterns = {"ACME-\\d+"};
    EXPECT_TRUE(has_detection(detect_sensitive_context(json{{"order", "ACME-12"}}, cfg), "order", "custom-pattern"));

    cfg.sanitize_nested_objects = false;
    json nested = json::parse(R"({"outer": {"password": "x"}})");
    EXPECT_TRUE(detect_sensitive_context(nested, cfg).empty());
}

TEST_F(ContextRedactorTest, RedactedArrayItems) {
    ContextValue emails = ContextValue::array();
    emails.push("a@b.co").push("plain");
    ctx_.set("list", emails);
    SanitizedErrorContext r = sanitize_error_context(error_, ctx_);
    // the array path itself carries a detection, so the whole property goes
    EXPECT_FALSE(r.context.contains("list"));
    EXPECT_THAT(r.redacted_properties, Contains("list"));
}

TEST_F(ContextRedactorTest, ForwardingPlainError) {
    ForwardedError fe = create_safe_error_for_forwarding(error_);
    EXPECT_EQ(fe.message, "boom");
    EXPECT_EQ(fe.type, "Error");
    EXPECT_EQ(fe.severity, Severity::Low);
    EXPECT_FALSE(fe.had_sensitive_data);
    json j = fe.to_json();
    EXPECT_EQ(j["severity"], "low");
    EXPECT_EQ(j["metadata"]["redactedCount"], 0);
    EXPECT_EQ(j["errorId"], fe.error_id);
}

TEST_F(ContextRedactorTest, ForwardingSeverity) {
    error_.name = "SecurityError";
    EXPECT_EQ(create_safe_error_for_forwarding(error_).severity, Severity::High);

    ErrorInfo plain;
    plain.message = "boom";
    ctx_.set("password", "x");
    ForwardedError fe = create_safe_error_for_forwarding(plain, ctx_);
    EXPECT_EQ(fe.severity, Severity::Medium);
    EXPECT_EQ(fe.redacted_count, 1u);
}

TEST_F(ContextRedactorTest, ForwardingWarningsCapped) {
    for(int i = 1; i <= 15; ++i) ctx_.set("password" + std::to_string(i), "v");
    ForwardedError fe = create_safe_error_for_forwarding(error_, ctx_);
    ASSERT_EQ(fe.security_warnings.size(), MAX_FORWARDED_WARNINGS + 1);
    EXPECT_EQ(fe.security_warnings.back(), "... and 5 more security warnings (truncated for telemetry)");
    EXPECT_EQ(fe.redacted_count, 15u);
}

TEST_F(ContextRedactorTest, ForwardingPayloadWithinDefaultCap) {
    for(int i = 0; i < 50; ++i) ctx_.set("field" + std::to_string(i), prose(300));
    ForwardedError fe = create_safe_error_for_forwarding(error_, ctx_);
    EXPECT_LE(fe.serialize().size(), static_cast<size_t>(DEFAULT_MAX_FORWARDING_SIZE));
}

TEST_F(ContextRedactorTest, ForwardingAggressiveReduction) {
    for(int i = 0; i < 50; ++i) ctx_.set("field" + std::to_string(i), prose(300));
    ErrorContextConfig cfg = forwarding_context_config();
    cfg.max_forwarding_size = 1024;
    ForwardedError fe = create_safe_error_for_forwarding(error_, ctx_, cfg);
    EXPECT_LE(fe.serialize().size(), 1024u);
    EXPECT_THAT(fe.security_warnings, Contains("Payload size exceeded telemetry limits - applying aggressive reduction"));
    EXPECT_TRUE(fe.context.contains("timestamp"));
    EXPECT_EQ(fe.severity, Severity::Medium);
}

TEST_F(ContextRedactorTest, ForwardingMinimumCapShrinksFixedFields) {
    error_.message = prose(60);
    for(int i = 1; i <= 15; ++i) ctx_.set("password" + std::to_string(i), "v");
    ErrorContextConfig cfg = forwarding_context_config();
    cfg.max_forwarding_size = 256;
    ForwardedError fe = create_safe_error_for_forwarding(error_, ctx_, cfg);
    EXPECT_LE(fe.serialize().size(), 256u);
    EXPECT_TRUE(fe.context.empty());
    EXPECT_THAT(fe.message, ::testing::StartsWith("lorem"));
    EXPECT_THAT(fe.message, EndsWith("..."));
    EXPECT_EQ(fe.type, "Error");
    EXPECT_EQ(fe.severity, Severity::Medium);
    EXPECT_EQ(fe.redacted_count, 15u);
}

TEST_F(ContextRedactorTest, StripDangerousKeysRecursesIntoArrays) {
    ContextValue inner = ContextValue::object();
    inner.set("prototype", 1).set("ok", 2);
    ContextValue arr = ContextValue::array();
    arr.push(inner);
    std::vector<std::string> warnings;
    ContextValue cleaned = strip_dangerous_keys(arr, warnings);
    EXPECT_EQ(safe_dump(context_to_json(cleaned)), R"([{"ok":2}])");
    EXPECT_TRUE(warnings.empty());
}

}
