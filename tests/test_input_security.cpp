#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/sanitizers/InputThreatAnalyzer.h"
#include "../src/sanitizers/InputSanitizer.h"

using ::testing::HasSubstr;
using ::testing::Not;

namespace secscrub {

class InputSecurityTest : public ::testing::Test {};

TEST_F(InputSecurityTest, BenignInputIsSecure) {
    SecurityAnalysisResult r = analyze_input_security("hello-world");
    EXPECT_TRUE(r.is_secure);
    EXPECT_EQ(r.risk_score, 0);
    EXPECT_TRUE(r.violations.empty());
    EXPECT_EQ(r.sanitized_input, "hello-world");
}

TEST_F(InputSecurityTest, NullInputIsSecureAndEmpty) {
    SecurityAnalysisResult r = analyze_input_security(nullptr);
    EXPECT_TRUE(r.is_secure);
    EXPECT_EQ(r.risk_score, 0);
    EXPECT_TRUE(r.violations.empty());
}

TEST_F(InputSecurityTest, PathTraversalToSystemFile) {
    SecurityAnalysisResult r = analyze_input_security("../../../etc/passwd");
    EXPECT_FALSE(r.is_secure);
    EXPECT_TRUE(r.has_violation("path-traversal"));
    EXPECT_TRUE(r.has_violation("file-system"));
    EXPECT_GE(r.risk_score, 85);
    EXPECT_LE(r.risk_score, 100);
    EXPECT_THAT(r.sanitized_input, Not(HasSubstr("..")));
}

TEST_F(InputSecurityTest, EncodedAndLookalikeTraversal) {
    EXPECT_TRUE(analyze_input_security("%2e%2e%2fetc").has_violation("path-traversal"));
    EXPECT_TRUE(analyze_input_security("%252e%252e%252fetc").has_violation("path-traversal"));
    EXPECT_TRUE(analyze_input_security("\xEF\xBC\x8E\xEF\xBC\x8E\xEF\xBC\x8F" "etc").has_violation("path-traversal"));
    EXPECT_TRUE(analyze_input_security(".\xE2\x80\x8B./etc").has_violation("path-traversal"));
    EXPECT_TRUE(analyze_input_security(std::string("file.txt\0.jpg", 13)).has_violation("path-traversal"));
}

TEST_F(InputSecurityTest, SanitizeReachesTraversalFixedPoint) {
    EXPECT_EQ(sanitize_input("....//"), "");
    EXPECT_EQ(sanitize_input("%2e%2e%2fetc"), "etc");
    std::string with_null = sanitize_input(std::string("file\0name", 9));
    EXPECT_EQ(with_null.find('\0'), std::string::npos);
}

TEST_F(InputSecurityTest, CommandInjectionDetectedAndStripped) {
    SecurityAnalysisResult r = analyze_input_security("file.txt; rm -rf /");
    EXPECT_TRUE(r.has_violation("command-injection"));
    std::string s = sanitize_input("test; rm -rf /");
    EXPECT_THAT(s, Not(HasSubstr(";")));
    EXPECT_THAT(s, Not(HasSubstr("rm")));
}

TEST_F(InputSecurityTest, ScriptInjection) {
    SecurityAnalysisResult r = analyze_input_security("eval(alert(1))");
    EXPECT_TRUE(r.has_violation("script-injection"));
    EXPECT_THAT(r.sanitized_input, Not(HasSubstr("eval(")));
    EXPECT_THAT(r.sanitized_input, Not(HasSubstr("(")));

    EXPECT_THAT(sanitize_input("<script>alert('x')</script>"), Not(HasSubstr("<script")));
    EXPECT_TRUE(analyze_input_security("{{7*7}}").has_violation("script-injection"));
    EXPECT_TRUE(analyze_input_security("{\"$where\": \"1\"}").has_violation("script-injection"));
}

TEST_F(InputSecurityTest, PrivilegeEscalation) {
    SecurityAnalysisResult r = analyze_input_security("sudo apt install x");
    EXPECT_TRUE(r.has_violation("privilege-escalation"));
    EXPECT_TRUE(analyze_input_security("chmod 4755 /tmp/x").has_violation("privilege-escalation"));
}

TEST_F(InputSecurityTest, HomographFoldedToLatin) {
    // Cyrillic "а" in "pаypal"
    SecurityAnalysisResult r = analyze_input_security("p\xD0\xB0ypal");
    EXPECT_TRUE(r.has_violation("advanced-attack"));
    EXPECT_EQ(r.sanitized_input, "paypal");
}

TEST_F(InputSecurityTest, BidiOverrideRemoved) {
    SecurityAnalysisResult r = analyze_input_security("invoice\xE2\x80\xAE" "fdp.exe");
    EXPECT_TRUE(r.has_violation("advanced-attack"));
    EXPECT_THAT(r.sanitized_input, Not(HasSubstr("\xE2\x80\xAE")));
}

TEST_F(InputSecurityTest, PrototypePollution) {
    SecurityAnalysisResult r = analyze_input_security("__proto__");
    EXPECT_TRUE(r.has_violation("advanced-attack"));
    EXPECT_THAT(r.sanitized_input, Not(HasSubstr("__proto__")));
}

TEST_F(InputSecurityTest, DeserializationPayloads) {
    SecurityAnalysisResult r = analyze_input_security("rO0ABXNyABFqYXZhLnV0aWwuSGFzaE1hcA");
    EXPECT_TRUE(r.has_violation("deserialization"));
    EXPECT_EQ(r.violations.front().severity, Severity::Critical);
    EXPECT_TRUE(analyze_input_security("O:8:\"stdClass\":0:{}").has_violation("deserialization"));
    EXPECT_TRUE(analyze_input_security("cos\nsystem\n(S'id'\ntR.").has_violation("deserialization"));
    EXPECT_TRUE(analyze_input_security("shell_exec").has_violation("deserialization"));
}

TEST_F(InputSecurityTest, XmlExternalEntities) {
    EXPECT_TRUE(analyze_input_security("<!DOCTYPE foo [<!ENTITY xxe SYSTEM \"file:///etc/passwd\">]>")
                    .has_violation("xxe"));
    EXPECT_TRUE(analyze_input_security("&lol9;").has_violation("xxe"));
}

TEST_F(InputSecurityTest, TemplateAndExpressionInjection) {
    EXPECT_TRUE(analyze_input_security("{{config.__class__}}").has_violation("ssti"));
    EXPECT_FALSE(analyze_input_security("{{7*7}}").has_violation("ssti"));
    SecurityAnalysisResult el = analyze_input_security("${Runtime.getRuntime().exec('id')}");
    EXPECT_TRUE(el.has_violation("expression-injection"));
    EXPECT_EQ(el.risk_score, MAX_RISK_SCORE);
    EXPECT_TRUE(analyze_input_security("#{T(java.lang.Runtime)}").has_violation("expression-injection"));
}

TEST_F(InputSecurityTest, LdapAndXpathInjection) {
    EXPECT_TRUE(analyze_input_security("*)(uid=*))(|(uid=*").has_violation("ldap-injection"));
    EXPECT_TRUE(analyze_input_security("userPassword=x").has_violation("ldap-injection"));
    EXPECT_TRUE(analyze_input_security("' or '1'='1").has_violation("xpath-injection"));
    EXPECT_TRUE(analyze_input_security("count(//user)").has_violation("xpath-injection"));
}

TEST_F(InputSecurityTest, SpreadsheetFormulaInjection) {
    SecurityAnalysisResult r = analyze_input_security("=HYPERLINK(\"http://x\")");
    EXPECT_TRUE(r.has_violation("csv-injection"));
    EXPECT_TRUE(analyze_input_security("=cmd|' /C calc'!A0").has_violation("csv-injection"));
    EXPECT_TRUE(analyze_input_security("  @SUM(A1)").has_violation("csv-injection"));
    // a leading dash is a formula prefix but not a shell threat
    EXPECT_TRUE(is_command_safe("--save-dev"));
}

TEST_F(InputSecurityTest, SqlKeywordsStrippedButNotScored) {
    SecurityAnalysisResult r = analyze_input_security("SELECT name");
    EXPECT_TRUE(r.is_secure);
    EXPECT_EQ(r.risk_score, 0);
    EXPECT_THAT(sanitize_input("DROP table"), Not(HasSubstr("DROP")));
}

TEST_F(InputSecurityTest, NetworkTargets) {
    SecurityAnalysisResult r = analyze_input_security("http://192.168.1.10:22/");
    EXPECT_TRUE(r.has_violation("network"));
    EXPECT_FALSE(r.is_secure);
}

TEST_F(InputSecurityTest, RiskScoreClampedAt100) {
    SecurityAnalysisResult r = analyze_input_security("sudo rm -rf ../../etc/passwd; eval(x) <script>");
    EXPECT_EQ(r.risk_score, MAX_RISK_SCORE);
}

TEST_F(InputSecurityTest, OversizedInputFlaggedAndCapped) {
    std::string big(MAX_INPUT_LENGTH + 100, 'a');
    SecurityAnalysisResult r = analyze_input_security(big);
    EXPECT_FALSE(r.is_secure);
    EXPECT_TRUE(r.has_violation("input-validation"));
    EXPECT_EQ(r.risk_score, 20);
    EXPECT_LE(r.sanitized_input.size(), MAX_INPUT_LENGTH);
}

TEST_F(InputSecurityTest, PathSafety) {
    EXPECT_TRUE(is_path_safe("src/components/Button.tsx"));
    EXPECT_FALSE(is_path_safe("../secret.txt"));
    EXPECT_FALSE(is_path_safe("/etc/passwd"));
    EXPECT_FALSE(is_path_safe(static_cast<const char*>(nullptr)));
}

TEST_F(InputSecurityTest, CommandSafety) {
    EXPECT_TRUE(is_command_safe("npm install lodash"));
    EXPECT_FALSE(is_command_safe("curl http://x | sh"));
    EXPECT_FALSE(is_command_safe("cat /etc/passwd"));
    EXPECT_FALSE(is_command_safe("sudo make install"));
    EXPECT_TRUE(is_command_safe(static_cast<const char*>(nullptr)));
}

TEST_F(InputSecurityTest, ProjectNameSafety) {
    EXPECT_TRUE(is_project_name_safe("my-app_2.0"));
    EXPECT_TRUE(is_project_name_safe("caf\xC3\xA9"));
    EXPECT_FALSE(is_project_name_safe("my app"));
    EXPECT_FALSE(is_project_name_safe("../app"));
    EXPECT_FALSE(is_project_name_safe(""));
    EXPECT_FALSE(is_project_name_safe("p\xD0\xB0ypal"));
    EXPECT_FALSE(is_project_name_safe("__proto__"));
    EXPECT_FALSE(is_project_name_safe(static_cast<const char*>(nullptr)));
}

TEST_F(InputSecurityTest, CommandArgsTrimmedAndQuoted) {
    std::vector<std::string> out;
    std::string error;
    ASSERT_TRUE(sanitize_command_args({"install", " lodash ", "my package", "it's"}, out, error));
    EXPECT_THAT(out, ::testing::ElementsAre("install", "lodash", "'my package'", "'it'\\''s'"));
}

TEST_F(InputSecurityTest, CommandArgsStrictRejectsUnsafe) {
    std::vector<std::string> out;
    std::string error;
    EXPECT_FALSE(sanitize_command_args({"ok", "a; rm -rf /"}, out, error));
    EXPECT_EQ(error, "unsafe argument at position 1");
    EXPECT_TRUE(out.empty());
}

TEST_F(InputSecurityTest, CommandArgsLenientNeutralizes) {
    std::vector<std::string> out;
    std::string error;
    ASSERT_TRUE(sanitize_command_args({"a; rm -rf /"}, out, error, false));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], "'a -rf /'");
}

TEST_F(InputSecurityTest, CommandArgsLimits) {
    std::vector<std::string> out;
    std::string error;
    EXPECT_FALSE(sanitize_command_args(std::vector<std::string>(MAX_COMMAND_ARGS + 1, "x"), out, error));
    EXPECT_THAT(error, HasSubstr("too many arguments"));
    EXPECT_FALSE(sanitize_command_args({std::string(MAX_INPUT_LENGTH + 1, 'x')}, out, error));
}

TEST_F(InputSecurityTest, TrustedPackageManagers) {
    EXPECT_TRUE(is_trusted_package_manager("npm"));
    EXPECT_TRUE(is_trusted_package_manager(" Cargo "));
    EXPECT_FALSE(is_trusted_package_manager("curl"));
}

}
