#include <gtest/gtest.h>
#include "sync/RuleEngine.hpp"
#include "sync/glob.hpp"
#include "types/Error.hpp"

using namespace ms::sync;
using namespace ms::types;

namespace {

ErrorKind compileError(const std::vector<SyncRule>& rules) {
    try {
        (void)RuleEngine::compile(rules, "user_app");
    } catch (const Error& e) {
        EXPECT_EQ(e.submodule(), "user_app");
        return e.kind();
    }
    ADD_FAILURE() << "compile() accepted the rule set";
    return ErrorKind::SyncFailed;
}

}

TEST(GlobTest, SingleStarStopsAtSlash) {
    EXPECT_TRUE(globMatch("*.dart", "main.dart"));
    EXPECT_FALSE(globMatch("*.dart", "src/main.dart"));
    EXPECT_TRUE(globMatch("**.dart", "src/main.dart"));
    EXPECT_TRUE(globMatch("lib/**", "lib/a/b/c"));
}

TEST(GlobTest, QuestionMarkAndClasses) {
    EXPECT_TRUE(globMatch("file?.txt", "file1.txt"));
    EXPECT_FALSE(globMatch("file?.txt", "file/.txt"));
    EXPECT_TRUE(globMatch("[a-c]x", "bx"));
    EXPECT_FALSE(globMatch("[!a-c]x", "bx"));
    EXPECT_TRUE(globMatch("\\*", "*"));
    EXPECT_FALSE(globMatch("\\*", "a"));
}

TEST(RuleEngineTest, CompileIsDeterministicAndKeepsExplicitCatchAll) {
    const std::vector rules{SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml"), SyncRule::exclude("*")};

    const auto first = RuleEngine::compile(rules);
    const auto second = RuleEngine::compile(rules);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.rules(), rules);
    EXPECT_FALSE(first.hasImplicitCatchAll());
}

TEST(RuleEngineTest, AppendsImplicitCatchAll) {
    const auto set = RuleEngine::compile({SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml")});

    ASSERT_EQ(set.rules().size(), 3u);
    EXPECT_EQ(set.rules().back(), SyncRule::exclude("*"));
    EXPECT_TRUE(set.hasImplicitCatchAll());
}

TEST(RuleEngineTest, ExcludeOnlyIsVacuous) {
    EXPECT_EQ(compileError({SyncRule::exclude("*")}), ErrorKind::VacuousRuleSet);
    EXPECT_EQ(compileError({SyncRule::exclude("build/"), SyncRule::exclude("*.tmp")}), ErrorKind::VacuousRuleSet);
}

TEST(RuleEngineTest, EmptyRuleListIsVacuous) {
    EXPECT_EQ(compileError({}), ErrorKind::VacuousRuleSet);
}

TEST(RuleEngineTest, EmptyOrControlPatternsAreInvalid) {
    EXPECT_EQ(compileError({SyncRule::include("")}), ErrorKind::InvalidRule);
    EXPECT_EQ(compileError({SyncRule::include("lib/***"), SyncRule::exclude("   ")}), ErrorKind::InvalidRule);
    EXPECT_EQ(compileError({SyncRule::include("lib\n/***")}), ErrorKind::InvalidRule);
}

TEST(RuleEngineTest, NarrowerExcludeInsideIncludedSubtreeWins) {
    const auto set = RuleEngine::compile({SyncRule::include("lib/***"), SyncRule::exclude("lib/secret/***")});

    EXPECT_FALSE(set.includes("lib/secret/key"));
    EXPECT_TRUE(set.includes("lib/main.dart"));
    EXPECT_TRUE(set.includes("lib/src/widgets/button.dart"));

    const std::vector expected{SyncRule::exclude("lib/secret/***"), SyncRule::include("lib/***"), SyncRule::exclude("*")};
    EXPECT_EQ(set.rules(), expected);
}

TEST(RuleEngineTest, EarlierIncludeInsideMovedExcludeStaysEffective) {
    const auto set = RuleEngine::compile({SyncRule::include("lib/***"), SyncRule::include("lib/secret/keep.txt"),
                                          SyncRule::exclude("lib/secret/***")});

    const std::vector expected{SyncRule::include("lib/secret/keep.txt"), SyncRule::include("lib/secret/"),
                               SyncRule::exclude("lib/secret/***"), SyncRule::include("lib/***"), SyncRule::exclude("*")};
    EXPECT_EQ(set.rules(), expected);

    const auto d = set.decide("lib/secret/keep.txt");
    EXPECT_TRUE(d.included());
    EXPECT_EQ(d.decidedAt, "lib/secret/keep.txt");
    EXPECT_FALSE(set.includes("lib/secret/key"));
    EXPECT_TRUE(set.includes("lib/main.dart"));
}

TEST(RuleEngineTest, IncludeMovedAboveExcludedSubtreeIsReachable) {
    const auto set = RuleEngine::compile({SyncRule::exclude("lib/***"), SyncRule::exclude("lib/api/internal.dart"),
                                          SyncRule::include("lib/api/***")});

    const std::vector expected{SyncRule::exclude("lib/api/internal.dart"), SyncRule::include("lib/api/***"),
                               SyncRule::include("lib/"), SyncRule::exclude("lib/***"), SyncRule::exclude("*")};
    EXPECT_EQ(set.rules(), expected);

    EXPECT_TRUE(set.includes("lib/api/client.dart"));
    EXPECT_FALSE(set.includes("lib/api/internal.dart"));
    EXPECT_FALSE(set.includes("lib/src/impl.dart"));
}

TEST(RuleEngineTest, DirectoryOnlyExcludeStillHidesContentsAroundCarveOut) {
    const auto set = RuleEngine::compile({SyncRule::exclude("build/"), SyncRule::include("build/keep.txt"),
                                          SyncRule::include("**")});

    EXPECT_TRUE(set.includes("build/keep.txt"));
    EXPECT_FALSE(set.includes("build/output.bin"));
    EXPECT_TRUE(set.includes("lib/main.dart"));
}

TEST(RuleEngineTest, FirstMatchWinsByPosition) {
    const auto set = RuleEngine::compile({SyncRule::exclude("*.g.dart"), SyncRule::include("lib/***")});

    EXPECT_FALSE(set.includes("lib/model.g.dart"));
    EXPECT_TRUE(set.includes("lib/model.dart"));

    const auto d = set.decide("lib/model.g.dart");
    ASSERT_TRUE(d.rule.has_value());
    EXPECT_EQ(*d.rule, 0u);
    EXPECT_FALSE(d.implicit);
}

TEST(RuleEngineTest, UnmatchedPathsFallToImplicitExclude) {
    const auto set = RuleEngine::compile({SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml")});

    const auto d = set.decide("README.md");
    EXPECT_FALSE(d.included());
    EXPECT_TRUE(d.implicit);

    EXPECT_TRUE(set.includes("pubspec.yaml"));
    EXPECT_FALSE(set.includes("android/app/build.gradle"));
}

TEST(RuleEngineTest, ExcludedAncestorHidesDescendants) {
    // rsync never descends into "src", so the file include below cannot take effect
    const auto set = RuleEngine::compile({SyncRule::include("src/keep.txt")});

    const auto d = set.decide("src/keep.txt");
    EXPECT_FALSE(d.included());
    EXPECT_EQ(d.decidedAt, "src");
}

TEST(RuleEngineTest, DirectoryOnlyPatterns) {
    const auto set = RuleEngine::compile({SyncRule::exclude("build/"), SyncRule::include("**")});

    EXPECT_FALSE(set.includes("build", true));
    EXPECT_FALSE(set.includes("build/output.bin"));
    EXPECT_TRUE(set.includes("build"));  // a plain file called build
}

TEST(RuleEngineTest, AnchoredPatternsOnlyMatchAtRoot) {
    const auto set = RuleEngine::compile({SyncRule::include("/pubspec.yaml"), SyncRule::include("lib/***")});

    EXPECT_TRUE(set.includes("pubspec.yaml"));
    EXPECT_FALSE(set.includes("tool/pubspec.yaml"));
    EXPECT_FALSE(RuleEngine::matches(SyncRule::include("/pubspec.yaml"), "tool/pubspec.yaml", false));
    EXPECT_TRUE(RuleEngine::matches(SyncRule::include("pubspec.yaml"), "tool/pubspec.yaml", false));
}

TEST(RuleEngineTest, SubtreeContainment) {
    EXPECT_TRUE(RuleEngine::containsSubtreeOf(SyncRule::include("lib/***"), SyncRule::exclude("lib/secret/***")));
    EXPECT_TRUE(RuleEngine::containsSubtreeOf(SyncRule::include("lib/"), SyncRule::exclude("lib/a.txt")));
    EXPECT_FALSE(RuleEngine::containsSubtreeOf(SyncRule::include("lib/***"), SyncRule::exclude("library/x")));
    EXPECT_FALSE(RuleEngine::containsSubtreeOf(SyncRule::include("pubspec.yaml"), SyncRule::exclude("pubspec.yaml/x")));
}

TEST(RuleEngineTest, RulesInsideSameKindSubtreeKeepTheirPlace) {
    const std::vector rules{SyncRule::include("lib/***"), SyncRule::include("lib/src/***"), SyncRule::exclude("*")};
    EXPECT_EQ(RuleEngine::compile(rules).rules(), rules);
}

TEST(RuleEngineTest, DecideRejectsEmptyPath) {
    const auto set = RuleEngine::compile({SyncRule::include("lib/***")});
    EXPECT_THROW((void)set.decide(""), std::invalid_argument);
}
