#include "TempDir.hpp"
#include "FakeMirror.hpp"
#include "config/ConfigStore.hpp"
#include "registry/SubmoduleRegistry.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/SiblingLocks.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"

#include <future>
#include <nlohmann/json.hpp>

using namespace ms::config;
using namespace ms::registry;
using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::types;

namespace {
const std::vector<SyncRule> kRules{SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml"), SyncRule::exclude("*")};
}

class SyncOrchestratorTest : public TempDirTest {
protected:
    std::shared_ptr<ConfigStore> store;
    std::shared_ptr<SubmoduleRegistry> registry;
    std::shared_ptr<FakeMirror> mirror;
    std::shared_ptr<std::atomic<bool>> interrupt;
    std::shared_ptr<Orchestrator> orchestrator;

    void SetUp() override {
        TempDirTest::SetUp();
        store = std::make_shared<ConfigStore>(root);
        store->init();
        registry = std::make_shared<SubmoduleRegistry>(store);
        mirror = std::make_shared<FakeMirror>();
        interrupt = std::make_shared<std::atomic<bool>>(false);
        orchestrator = std::make_shared<Orchestrator>(registry, mirror, interrupt);
    }

    void addSubmodule(const std::string& name, const bool withSibling = true,
                      const std::vector<SyncRule>& rules = kRules) {
        makeSubmoduleDir(name);
        if (withSibling) makeSiblingDir(name);
        registry->add(name, rules);
    }
};

TEST_F(SyncOrchestratorTest, BatchWithOneMissingSiblingStillSucceeds) {
    addSubmodule("user_app");
    addSubmodule("admin_app", false);
    addSubmodule("driver_app");

    const auto report = orchestrator->sync("all");

    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(report.skipped(), 1u);
    EXPECT_EQ(report.failed(), 0u);
    EXPECT_TRUE(report.ok());

    EXPECT_EQ(report.outcomes[0].submodule, "user_app");
    EXPECT_EQ(report.outcomes[1].submodule, "admin_app");
    EXPECT_EQ(report.outcomes[1].kind, OutcomeKind::Skipped);
    EXPECT_EQ(report.outcomes[1].error, ErrorKind::SiblingNotFound);
    EXPECT_EQ(report.outcomes[2].submodule, "driver_app");
    EXPECT_EQ(mirror->requests().size(), 2u);
}

TEST_F(SyncOrchestratorTest, RequestCarriesPathsAndCompiledRules) {
    addSubmodule("user_app", true, {SyncRule::include("lib/***"), SyncRule::exclude("lib/secret/***")});
    registry->update("user_app", [](Submodule& s) { std::get<strategy::Mirror>(s.strategy).checksum = true; });

    const auto report = orchestrator->sync("user_app", {.dryRun = true});
    ASSERT_TRUE(report.ok());

    const auto reqs = mirror->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].source, root / "user_app");
    EXPECT_EQ(reqs[0].destination, work / "user_app");
    EXPECT_TRUE(reqs[0].deleteExtraneous);
    EXPECT_TRUE(reqs[0].checksum);
    EXPECT_TRUE(reqs[0].dryRun);

    const std::vector expected{SyncRule::exclude("lib/secret/***"), SyncRule::include("lib/***"), SyncRule::exclude("*")};
    EXPECT_EQ(reqs[0].rules.rules(), expected);
    EXPECT_EQ(report.outcomes[0].sibling, work / "user_app");
}

TEST_F(SyncOrchestratorTest, CollaboratorFailureIsIsolated) {
    addSubmodule("user_app");
    addSubmodule("admin_app");
    mirror->scripted["user_app"] = {23, "rsync: some files could not be transferred\n", ""};

    const auto report = orchestrator->sync();

    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].kind, OutcomeKind::Failed);
    EXPECT_EQ(report.outcomes[0].error, ErrorKind::SyncFailed);
    EXPECT_EQ(report.outcomes[0].exit_code, 23);
    EXPECT_EQ(report.outcomes[0].reason, "rsync: some files could not be transferred");
    EXPECT_EQ(report.outcomes[1].kind, OutcomeKind::Succeeded);
    EXPECT_TRUE(report.ok());
}

TEST_F(SyncOrchestratorTest, EveryFailureFailsTheBatch) {
    addSubmodule("user_app");
    mirror->scripted["user_app"] = {1, "", ""};

    const auto report = orchestrator->sync();
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.outcomes[0].reason, "mirroring tool exited with status 1");
}

TEST_F(SyncOrchestratorTest, EmptyRegistryIsNotOk) {
    const auto report = orchestrator->sync("all");
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_FALSE(report.ok());
}

TEST_F(SyncOrchestratorTest, VacuousRulesAreSkipped) {
    addSubmodule("user_app", true, {});
    addSubmodule("admin_app", true, {SyncRule::exclude("*")});
    addSubmodule("driver_app");

    const auto report = orchestrator->sync();

    EXPECT_EQ(report.outcomes[0].error, ErrorKind::VacuousRuleSet);
    EXPECT_EQ(report.outcomes[1].error, ErrorKind::VacuousRuleSet);
    EXPECT_EQ(report.outcomes[2].kind, OutcomeKind::Succeeded);
    EXPECT_EQ(mirror->requests().size(), 1u);
}

TEST_F(SyncOrchestratorTest, MissingSourceDirectoryIsSkipped) {
    addSubmodule("user_app");
    fs::remove_all(root / "user_app");

    const auto report = orchestrator->sync();
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].kind, OutcomeKind::Skipped);
    EXPECT_EQ(report.outcomes[0].error, ErrorKind::NotASubdirectory);
}

TEST_F(SyncOrchestratorTest, TargetListFollowsRegistryOrder) {
    addSubmodule("a");
    addSubmodule("b");
    addSubmodule("c");

    const auto report = orchestrator->sync("c, a");
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.outcomes[0].submodule, "a");
    EXPECT_EQ(report.outcomes[1].submodule, "c");
}

TEST_F(SyncOrchestratorTest, UnknownTargetFailsBeforeRunning) {
    addSubmodule("a");

    try {
        (void)orchestrator->sync("a,ghost");
        FAIL() << "sync accepted an unknown submodule";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownSubmodule);
        EXPECT_EQ(e.submodule(), "ghost");
    }
    EXPECT_TRUE(mirror->requests().empty());
}

TEST_F(SyncOrchestratorTest, SyncNeverWritesConfiguration) {
    addSubmodule("user_app");
    const auto before = ms::util::readFileToString(store->artifactPath());
    const auto mtime = fs::last_write_time(store->artifactPath());

    (void)orchestrator->sync();

    EXPECT_EQ(ms::util::readFileToString(store->artifactPath()), before);
    EXPECT_EQ(fs::last_write_time(store->artifactPath()), mtime);
}

TEST_F(SyncOrchestratorTest, CancellationSkipsRemainingSubmodules) {
    addSubmodule("a");
    addSubmodule("b");
    addSubmodule("c");
    mirror->onRun = [this](const MirrorRequest& req) { if (req.submodule == "a") orchestrator->cancel(); };

    const auto report = orchestrator->sync();

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.outcomes[0].kind, OutcomeKind::Succeeded);
    EXPECT_EQ(report.outcomes[1].kind, OutcomeKind::Skipped);
    EXPECT_EQ(report.outcomes[1].reason, "cancelled");
    EXPECT_EQ(report.outcomes[2].kind, OutcomeKind::Skipped);
    EXPECT_EQ(mirror->requests().size(), 1u);
}

TEST_F(SyncOrchestratorTest, ParallelRunKeepsRegistryOrder) {
    for (const auto* n : {"a", "b", "c", "d"}) addSubmodule(n);
    mirror->delay = std::chrono::milliseconds(30);
    mirror->scripted["c"] = {12, "protocol error", ""};

    const auto report = orchestrator->sync("all", {.maxParallel = 4});

    ASSERT_EQ(report.outcomes.size(), 4u);
    const std::vector<std::string> order{"a", "b", "c", "d"};
    for (size_t i = 0; i < order.size(); ++i) EXPECT_EQ(report.outcomes[i].submodule, order[i]);
    EXPECT_EQ(report.outcomes[2].kind, OutcomeKind::Failed);
    EXPECT_EQ(report.succeeded(), 3u);
    EXPECT_GT(mirror->maxConcurrent(), 1);
}

TEST_F(SyncOrchestratorTest, OverlappingSiblingsRunOneAtATime) {
    addSubmodule("a");
    makeSubmoduleDir("b");
    fs::create_symlink(work / "a", work / "b");
    registry->add("b", kRules);
    mirror->delay = std::chrono::milliseconds(20);

    const auto report = orchestrator->sync("all", {.maxParallel = 4});

    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(mirror->maxConcurrent(), 1);
}

TEST_F(SyncOrchestratorTest, SiblingLockIsSharedBySymlinkedAliases) {
    makeSiblingDir("a");
    fs::create_symlink(work / "a", work / "b");

    SiblingLocks locks;
    auto held = locks.acquire(work / "a");

    auto waiter = std::async(std::launch::async, [&locks, this] { auto l = locks.acquire(work / "b"); });
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    held.unlock();
    EXPECT_EQ(waiter.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // distinct directories never contend
    makeSiblingDir("c");
    held.lock();
    auto other = std::async(std::launch::async, [&locks, this] { auto l = locks.acquire(work / "c"); });
    EXPECT_EQ(other.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST_F(SyncOrchestratorTest, ReportSummaryAndJson) {
    addSubmodule("user_app");
    addSubmodule("admin_app", false);

    const auto report = orchestrator->sync();
    EXPECT_EQ(report.summary(), "1 succeeded, 0 failed, 1 skipped");

    const nlohmann::json j = report;
    EXPECT_TRUE(j.at("ok").get<bool>());
    EXPECT_EQ(j.at("outcomes").size(), 2u);
    EXPECT_EQ(j.at("outcomes")[1].at("error").get<std::string>(), "SiblingNotFound");
    EXPECT_EQ(report.outcomes[0].line(), "user_app: synced -> " + (work / "user_app").string());
}
