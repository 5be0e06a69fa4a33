#include <gtest/gtest.h>

#include "task/exception.hpp"
#include "task/variables.hpp"

using namespace emuflow::task;

TEST(VariablesTest, MergeScopes_Precedence) {
    VariableMap global = {{"A", "global"}, {"B", "global"}, {"C", "global"}};
    VariableMap local = {{"B", "local"}, {"C", "local"}};
    VariableMap overrides = {{"C", "override"}};

    auto merged = mergeScopes(global, local, overrides);
    EXPECT_EQ(merged.at("A"), "global");
    EXPECT_EQ(merged.at("B"), "local");
    EXPECT_EQ(merged.at("C"), "override");
}

TEST(VariablesTest, FindPlaceholders_TrimsNames) {
    auto names = findPlaceholders("cp ${{ SRC }} ${{DST}} ${{my-var_1}}");

    ASSERT_EQ(names.size(), 3);
    EXPECT_EQ(names[0], "SRC");
    EXPECT_EQ(names[1], "DST");
    EXPECT_EQ(names[2], "my-var_1");
}

TEST(VariablesTest, ResolvePlaceholders_Basic) {
    EXPECT_EQ(resolvePlaceholders("echo ${{X}}", {{"X", "hi"}}), "echo hi");
}

TEST(VariablesTest, ResolvePlaceholders_RepeatedAndAdjacent) {
    EXPECT_EQ(resolvePlaceholders("${{A}}${{B}}-${{A}}", {{"A", "1"}, {"B", "2"}}),
              "12-1");
}

TEST(VariablesTest, ResolvePlaceholders_IsNotRecursive) {
    VariableMap scope = {{"A", "${{B}}"}, {"B", "value"}};
    EXPECT_EQ(resolvePlaceholders("${{A}}", scope), "${{B}}");
}

TEST(VariablesTest, ResolvePlaceholders_LeavesOtherSyntaxAlone) {
    EXPECT_EQ(resolvePlaceholders("echo ${HOME} $PATH {{X}}", {}),
              "echo ${HOME} $PATH {{X}}");
}

TEST(VariablesTest, ResolvePlaceholders_UndefinedVariableThrows) {
    EXPECT_THROW(
        { [[maybe_unused]] auto r = resolvePlaceholders("echo ${{X}}", {}); },
        emuflow::UnresolvedVariable);
}
