#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Config.h"
#include "../src/core/ConfigValidator.h"
#include "../src/core/Logging.h"
#include <sstream>

namespace secscrub {

class ConfigValidatorTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_stream(&log_); }
    void TearDown() override { Logger::instance().set_stream(nullptr); }
    std::ostringstream log_;
};

TEST_F(ConfigValidatorTest, DefaultsAreValid) {
    ErrorSanitizationConfig s;
    ErrorContextConfig c;
    EXPECT_TRUE(ConfigValidator::normalize(s));
    EXPECT_TRUE(ConfigValidator::normalize(c));
    EXPECT_TRUE(log_.str().empty());
}

TEST_F(ConfigValidatorTest, DefaultValues) {
    ErrorSanitizationConfig s;
    EXPECT_TRUE(s.redact_passwords);
    EXPECT_EQ(s.max_message_length, 500);
    EXPECT_EQ(s.max_stack_depth, 10);
    EXPECT_EQ(s.stack_trace_level, StackTraceLevel::Sanitized);
    EXPECT_FALSE(s.remove_line_numbers);
    ErrorContextConfig c;
    EXPECT_EQ(c.redaction_level, RedactionLevel::Partial);
    EXPECT_EQ(c.max_context_length, 1000);
    EXPECT_EQ(c.max_forwarding_size, 8000);
    EXPECT_THAT(c.allowed_properties, ::testing::ElementsAre("timestamp", "level", "operation", "component"));
}

TEST_F(ConfigValidatorTest, OutOfRangeValuesFallBackToDefaults) {
    ErrorSanitizationConfig s;
    s.max_stack_depth = 0;
    s.max_message_length = 5;
    EXPECT_FALSE(ConfigValidator::normalize(s));
    EXPECT_EQ(s.max_stack_depth, DEFAULT_MAX_STACK_DEPTH);
    EXPECT_EQ(s.max_message_length, DEFAULT_MAX_MESSAGE_LENGTH);
    EXPECT_THAT(log_.str(), ::testing::HasSubstr("[WARN] config: invalid max_stack_depth 0"));

    s.max_stack_depth = 1001;
    s.max_message_length = 100001;
    ConfigValidator::normalize(s);
    EXPECT_EQ(s.max_stack_depth, 10);
    EXPECT_EQ(s.max_message_length, 500);
}

TEST_F(ConfigValidatorTest, BoundaryValuesAccepted) {
    ErrorSanitizationConfig s;
    s.max_stack_depth = 1;
    s.max_message_length = 10;
    EXPECT_TRUE(ConfigValidator::normalize(s));
    EXPECT_EQ(s.max_stack_depth, 1);
    EXPECT_EQ(s.max_message_length, 10);

    ErrorContextConfig c;
    c.max_context_length = 1000000;
    c.max_forwarding_size = 256;
    EXPECT_TRUE(ConfigValidator::normalize(c));
}

TEST_F(ConfigValidatorTest, ContextLimitsClamped) {
    ErrorContextConfig c;
    c.max_context_length = 9;
    c.max_forwarding_size = 100;
    EXPECT_FALSE(ConfigValidator::normalize(c));
    EXPECT_EQ(c.max_context_length, DEFAULT_MAX_CONTEXT_LENGTH);
    EXPECT_EQ(c.max_forwarding_size, DEFAULT_MAX_FORWARDING_SIZE);
}

TEST_F(ConfigValidatorTest, CompilePatternsRejectsBadRegex) {
    std::vector<PatternWarning> warnings;
    auto compiled = ConfigValidator::compile_patterns({"ACME-\\d{4}", "([unclosed", ""}, warnings);
    ASSERT_EQ(compiled.size(), 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].code, "bad_regex");
    EXPECT_EQ(warnings[0].pattern, "([unclosed");
    EXPECT_TRUE(std::regex_search("order acme-1234", compiled[0])); // case-insensitive
}

TEST_F(ConfigValidatorTest, CompilePatternsRejectsOverlongSource) {
    std::vector<PatternWarning> warnings;
    auto compiled = ConfigValidator::compile_patterns({std::string(MAX_REGEX_LENGTH + 1, 'a')}, warnings);
    EXPECT_TRUE(compiled.empty());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].code, "regex_too_long");
}

TEST_F(ConfigValidatorTest, MergeAppliesOverridesThenValidates) {
    ErrorSanitizationOverrides o;
    o.redact_file_paths = false;
    o.max_message_length = 3;
    o.stack_trace_level = StackTraceLevel::Minimal;
    ErrorSanitizationConfig merged = merge_config(ErrorSanitizationConfig{}, o);
    EXPECT_FALSE(merged.redact_file_paths);
    EXPECT_TRUE(merged.redact_passwords);
    EXPECT_EQ(merged.stack_trace_level, StackTraceLevel::Minimal);
    EXPECT_EQ(merged.max_message_length, DEFAULT_MAX_MESSAGE_LENGTH);
}

TEST_F(ConfigValidatorTest, MergeContextOverrides) {
    ErrorContextOverrides o;
    o.redaction_level = RedactionLevel::Full;
    o.allowed_properties = std::vector<std::string>{"*"};
    ErrorContextConfig merged = merge_config(ErrorContextConfig{}, o);
    EXPECT_EQ(merged.redaction_level, RedactionLevel::Full);
    EXPECT_THAT(merged.allowed_properties, ::testing::ElementsAre("*"));
    EXPECT_TRUE(merged.generate_secure_ids);
}

TEST_F(ConfigValidatorTest, ParseEnumsCaseInsensitive) {
    StackTraceLevel l;
    EXPECT_TRUE(parse_stack_trace_level("FULL", l));
    EXPECT_EQ(l, StackTraceLevel::Full);
    EXPECT_FALSE(parse_stack_trace_level("verbose", l));
    Environment e;
    EXPECT_TRUE(parse_environment("prod", e));
    EXPECT_EQ(e, Environment::Production);
    EXPECT_TRUE(parse_environment("staging", e));
    EXPECT_EQ(e, Environment::Staging);
    RedactionLevel r;
    EXPECT_TRUE(parse_redaction_level("none", r));
    EXPECT_EQ(r, RedactionLevel::None);
    EXPECT_STREQ(to_string(RedactionLevel::Partial), "partial");
}

} // namespace secscrub

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
