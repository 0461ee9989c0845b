#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/sanitizers/StackTraceRedactor.h"
#include "../src/core/Logging.h"
#include <algorithm>
#include <sstream>

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::Not;

namespace secscrub {

class StackTraceRedactorTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_stream(&log_); }
    void TearDown() override { Logger::instance().set_stream(nullptr); }

    static std::string frames(const std::string& header, int n){
        std::string s = header;
        for(int i = 0; i < n; ++i) s += "\n    at fn (app.js:1:1)";
        return s;
    }

    const std::string stack_ = "Error: boom\n    at run (/Users/alice/app/index.js:10:5)";
    ErrorSanitizationConfig cfg_;
    std::ostringstream log_;
};

TEST_F(StackTraceRedactorTest, EmptyStack) {
    EXPECT_EQ(sanitize_stack_trace("", cfg_), "");
}

TEST_F(StackTraceRedactorTest, SanitizedLevelMasksHomeDirectory) {
    EXPECT_EQ(sanitize_stack_trace(stack_, cfg_), "Error: boom\n    at run (/Users/***/app/index.js:10:5)");
}

TEST_F(StackTraceRedactorTest, NoneLevelDropsStack) {
    cfg_.stack_trace_level = StackTraceLevel::None;
    EXPECT_EQ(sanitize_stack_trace(stack_, cfg_), "");
}

TEST_F(StackTraceRedactorTest, MinimalLevelKeepsHeaderAndFirstFrame) {
    cfg_.stack_trace_level = StackTraceLevel::Minimal;
    EXPECT_EQ(sanitize_stack_trace(frames(stack_, 3), cfg_), "Error: boom\n    at run (internal)");
}

TEST_F(StackTraceRedactorTest, NodeModulesCanonicalized) {
    std::string out = sanitize_stack_trace(
        "Error: x\n    at f (/Users/alice/app/node_modules/express/lib/router.js:5:3)", cfg_);
    EXPECT_THAT(out, HasSubstr("node_modules/express"));
    EXPECT_THAT(out, Not(HasSubstr("alice")));
    EXPECT_THAT(out, Not(HasSubstr("/Users")));
}

TEST_F(StackTraceRedactorTest, TraversalNeutralized) {
    std::string out = sanitize_stack_trace("Error: x\n    at f (../../secret.js:1:1)", cfg_);
    EXPECT_THAT(out, HasSubstr("[PATH-TRAVERSAL]/"));
    EXPECT_THAT(out, Not(HasSubstr("../")));
}

TEST_F(StackTraceRedactorTest, SensitiveFileNamesRedacted) {
    std::string out = sanitize_stack_trace("Error: x\n    at read (/app/.env)", cfg_);
    EXPECT_THAT(out, HasSubstr("[REDACTED]"));
    EXPECT_THAT(out, Not(HasSubstr(".env")));
}

TEST_F(StackTraceRedactorTest, ControlCharactersStripped) {
    EXPECT_EQ(sanitize_stack_trace("Error\x07: x", cfg_), "Error: x");
}

TEST_F(StackTraceRedactorTest, LineNumbersRemovedOnRequest) {
    cfg_.remove_line_numbers = true;
    EXPECT_EQ(sanitize_stack_trace(stack_, cfg_), "Error: boom\n    at run (/Users/***/app/index.js)");
}

TEST_F(StackTraceRedactorTest, DepthLimitCountsHiddenLines) {
    cfg_.max_stack_depth = 5;
    std::string out = sanitize_stack_trace(frames("Error: deep", 15), cfg_);
    EXPECT_THAT(out, EndsWith("\n... [11 more frames hidden for security]"));
}

TEST_F(StackTraceRedactorTest, OversizedInputTruncated) {
    std::string big = frames("Error: big", 3000);
    ASSERT_GT(big.size(), MAX_STACK_INPUT);
    std::string out = sanitize_stack_trace(big, cfg_);
    EXPECT_THAT(out, EndsWith("\n... [Stack trace truncated for security]"));
    EXPECT_THAT(log_.str(), HasSubstr("[WARN] stack: input of"));
}

TEST_F(StackTraceRedactorTest, ChunkedInputKeepsPathsWholeAndAddsNoLines) {
    cfg_.max_stack_depth = 1000;
    // the 5000-byte cut falls inside "/Users/alicesecret"
    std::string filler;
    while (filler.size() < 4985) filler += "abcdefghij";
    filler.resize(4985);
    std::string big = frames("Error: big\n    at f (" + filler + "/Users/alicesecret/app/index.js:1:1)", 250);
    ASSERT_GT(big.size(), STACK_CHUNK_THRESHOLD);
    ASSERT_LT(big.size(), MAX_STACK_INPUT);

    std::string out = sanitize_stack_trace(big, cfg_);
    EXPECT_THAT(out, Not(HasSubstr("alicesecret")));
    EXPECT_THAT(out, HasSubstr("/Users/***/app"));
    EXPECT_LE(std::count(out.begin(), out.end(), '\n'), std::count(big.begin(), big.end(), '\n'));
}

TEST_F(StackTraceRedactorTest, FullLevelHidesSshDirectoryAndSecretWords) {
    cfg_.stack_trace_level = StackTraceLevel::Full;
    std::string out = sanitize_stack_trace("Error: invalid token\n    at f (/home/bob/.ssh/id_rsa)", cfg_);
    EXPECT_THAT(out, HasSubstr("/home/***/[hidden]/id_rsa"));
    EXPECT_THAT(out, HasSubstr("Error: invalid [token]"));
}

TEST_F(StackTraceRedactorTest, FullLevelDepthNote) {
    cfg_.stack_trace_level = StackTraceLevel::Full;
    cfg_.max_stack_depth = 2;
    std::string out = sanitize_stack_trace(frames("Error: deep", 4), cfg_);
    EXPECT_THAT(out, EndsWith("[3 more frames, use higher maxStackDepth for full trace]"));
}

TEST_F(StackTraceRedactorTest, CollapseRepeatedCharacters) {
    EXPECT_EQ(collapse_repeated_chars(std::string(25, 'a')), "[REPEATED-CHARS]");
    EXPECT_EQ(collapse_repeated_chars(std::string(19, 'a')), std::string(19, 'a'));
    EXPECT_EQ(collapse_repeated_chars("x" + std::string(10, 'A') + std::string(10, 'a') + "y"), "x[REPEATED-CHARS]y");
    EXPECT_EQ(collapse_repeated_chars(std::string(30, '1')), std::string(30, '1'));
}

} // namespace secscrub

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
