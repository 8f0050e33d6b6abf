#include <string>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "policy/script_policy.hpp"

namespace {

using appbridge::core::errors::ErrorCategory;
using appbridge::core::errors::get_error;
using appbridge::core::errors::is_error;
using appbridge::policy::ScriptPolicy;
using appbridge::policy::ScriptRules;

std::string rejection_code(const ScriptPolicy& policy, const std::string& script) {
    auto result = policy.validate_script(script);
    if (!is_error(result)) {
        return "";
    }
    EXPECT_EQ(get_error(result).category, ErrorCategory::Policy);
    return get_error(result).code;
}

TEST(ScriptPolicyTest, AllowsOrdinaryScripts) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "activate"), "");
    EXPECT_EQ(rejection_code(policy, "get name of every window\nreturn count of windows"), "");
}

TEST(ScriptPolicyTest, AllowsBalancedNestedBlocks) {
    ScriptPolicy policy;
    const std::string script =
        "tell front window\n"
        "  if visible then\n"
        "    repeat with i from 1 to 3\n"
        "      try\n"
        "        set bounds to {0, 0, 800, 600}\n"
        "      on error msg\n"
        "        log msg\n"
        "      end try\n"
        "    end repeat\n"
        "  end if\n"
        "end tell\n";
    EXPECT_EQ(rejection_code(policy, script), "");
}

TEST(ScriptPolicyTest, OneLineTellAndIfDoNotOpenBlocks) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "tell front window to close\nif x then return 1"), "");
}

TEST(ScriptPolicyTest, RejectsClosingTheApplicationBlock) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "activate\nend tell\ntell application \"Terminal\""),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "END"), "script_escapes_block");

    auto result = policy.validate_script("end tell");
    ASSERT_TRUE(is_error(result));
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(ScriptPolicyTest, TreatsCarriageReturnsAsLineBreaks) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "activate\rend tell\rtell application \"Terminal\""),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "activate\r\nend tell\r\ntell application \"Terminal\""),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "tell front window\ractivate\rend tell\r"), "");
}

TEST(ScriptPolicyTest, SeesThroughBlockComments) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "activate\n(* x *) end tell\ntell application \"Terminal\""),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "(* outer (* inner *)\nstill comment *) end tell"),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "(* end tell\n  end tell *)\nactivate"), "");
    EXPECT_EQ(rejection_code(policy, "display dialog \"(*\"\nend tell"), "script_escapes_block");
}

TEST(ScriptPolicyTest, JoinsContinuedLines) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "activate\nend \xC2\xAC\ntell\ntell application \"Terminal\""),
              "script_escapes_block");
    EXPECT_EQ(rejection_code(policy, "tell front window \xC2\xAC\n  to close"), "");
}

TEST(ScriptPolicyTest, IgnoresKeywordsInStringsAndComments) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "-- end tell\ndisplay dialog \"end tell\"\n# end"), "");
}

TEST(ScriptPolicyTest, RejectsBlockedOperationsCaseInsensitively) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "Do Shell Script \"ls\""), "script_blocked_operation");
}

TEST(ScriptPolicyTest, RejectsBlockedOperationsAcrossWhitespaceAndContinuations) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, "do  shell  script \"id\""), "script_blocked_operation");
    EXPECT_EQ(rejection_code(policy, "do\tshell\r\nscript \"id\""), "script_blocked_operation");
    EXPECT_EQ(rejection_code(policy, "do shell \xC2\xAC\nscript \"id\""), "script_blocked_operation");
    EXPECT_EQ(rejection_code(policy, "do (* x *) shell script \"id\""), "script_blocked_operation");
}

TEST(ScriptPolicyTest, NormalizesBlockedEntriesToo) {
    ScriptPolicy policy(ScriptRules{{"  Run   Script "}});
    EXPECT_EQ(rejection_code(policy, "run script \"beep\""), "script_blocked_operation");
    EXPECT_EQ(rejection_code(policy, "run scripts"), "script_blocked_operation");
    EXPECT_EQ(rejection_code(policy, "running"), "");
}

TEST(ScriptPolicyTest, EmptyRulesAllowShellScripts) {
    ScriptPolicy policy(ScriptRules{{}});
    EXPECT_EQ(rejection_code(policy, "do shell script \"ls\""), "");
}

TEST(ScriptPolicyTest, RejectsNulBytes) {
    ScriptPolicy policy;
    EXPECT_EQ(rejection_code(policy, std::string("activate\0quit", 13)), "script_contains_nul");
}

TEST(ScriptPolicyTest, RejectsControlCharactersInAppName) {
    ScriptPolicy policy;
    EXPECT_FALSE(is_error(policy.validate_app_name("Microsoft Word")));

    auto result = policy.validate_app_name("Finder\"\nend tell");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_app_name");
}

}  // namespace
