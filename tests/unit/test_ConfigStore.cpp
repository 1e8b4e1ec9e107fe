#include "TempDir.hpp"
#include "config/ConfigStore.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"

#include <thread>
#include <vector>

using namespace ms::config;
using namespace ms::types;

class ConfigStoreTest : public TempDirTest {
protected:
    static MonorepoConfig sample(const fs::path& root) {
        MonorepoConfig cfg;
        cfg.root_path = root;
        cfg.submodules.push_back({"user_app", strategy::Mirror{}, {
            SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml"), SyncRule::exclude("*")}});
        cfg.submodules.push_back({"admin_app", strategy::Mirror{true}, {
            SyncRule::exclude("lib/secret/***"), SyncRule::include("lib/***"), SyncRule::include("[a-z]*.yaml")}});
        cfg.submodules.push_back({"empty_app", strategy::Mirror{}, {}});
        return cfg;
    }
};

TEST_F(ConfigStoreTest, LoadWithoutArtifactIsNotInitialized) {
    ConfigStore store(root);
    EXPECT_FALSE(store.isInitialized());
    try {
        (void)store.load();
        FAIL() << "load() succeeded without an artifact";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotInitialized);
    }
}

TEST_F(ConfigStoreTest, InitIsIdempotent) {
    ConfigStore store(root);
    EXPECT_TRUE(store.init());
    EXPECT_TRUE(fs::exists(root / ".monorepo" / "config.yaml"));

    auto cfg = store.load();
    EXPECT_EQ(cfg.root_path, root);
    EXPECT_TRUE(cfg.submodules.empty());
    EXPECT_EQ(cfg.version, CONFIG_FORMAT_VERSION);

    cfg = sample(root);
    store.save(cfg);
    EXPECT_FALSE(store.init());
    EXPECT_EQ(store.load(), cfg);
}

TEST_F(ConfigStoreTest, SaveThenLoadRoundTripsEveryField) {
    const auto cfg = sample(root);
    {
        ConfigStore store(root);
        store.save(cfg);
    }

    // a fresh instance stands in for a new process
    ConfigStore reopened(root);
    EXPECT_EQ(reopened.load(), cfg);
}

TEST_F(ConfigStoreTest, SaveLeavesNoTempFiles) {
    ConfigStore store(root);
    store.save(sample(root));
    store.save(sample(root));

    for (const auto& entry : fs::directory_iterator(root / ".monorepo"))
        EXPECT_EQ(entry.path().filename().string().find(".tmp"), std::string::npos) << entry.path();
}

TEST_F(ConfigStoreTest, CorruptArtifactIsReportedAndLeftUntouched) {
    ConfigStore store(root);
    store.init();

    const auto path = store.artifactPath();
    const std::string garbage = "root_path: [unterminated\n  - : :";
    writeFile(path, garbage);

    try {
        (void)store.load();
        FAIL() << "load() accepted a corrupt artifact";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigCorrupt);
    }

    EXPECT_THROW(store.update([](MonorepoConfig&) {}), Error);
    EXPECT_EQ(ms::util::readFileToString(path), garbage);
}

TEST_F(ConfigStoreTest, DuplicateNamesAreCorrupt) {
    ConfigStore store(root);
    store.init();
    writeFile(store.artifactPath(),
              "version: 1\nroot_path: " + root.string() + "\nsubmodules:\n"
              "  - {name: a, rules: [{kind: include, pattern: x}]}\n"
              "  - {name: a, rules: []}\n");

    EXPECT_THROW((void)store.load(), Error);
}

TEST_F(ConfigStoreTest, UnknownKeysAndNewerVersionsAreTolerated) {
    ConfigStore store(root);
    store.init();
    writeFile(store.artifactPath(),
              "version: 7\nroot_path: " + root.string() + "\nfuture_field: 1\nsubmodules:\n"
              "  - name: user_app\n    strategy: mirror\n    colour: blue\n    rules:\n"
              "      - {kind: include, pattern: \"lib/***\"}\n      - \"- *\"\n");

    const auto cfg = store.load();
    EXPECT_EQ(cfg.version, 7u);
    ASSERT_EQ(cfg.submodules.size(), 1u);
    const std::vector expected{SyncRule::include("lib/***"), SyncRule::exclude("*")};
    EXPECT_EQ(cfg.submodules[0].rules, expected);
}

TEST_F(ConfigStoreTest, UnknownStrategyIsCorrupt) {
    ConfigStore store(root);
    store.init();
    writeFile(store.artifactPath(),
              "root_path: " + root.string() + "\nsubmodules:\n  - {name: a, strategy: teleport}\n");

    EXPECT_THROW((void)store.load(), Error);
}

TEST_F(ConfigStoreTest, UpdateRejectsRootPathChange) {
    ConfigStore store(root);
    store.init();

    EXPECT_THROW(store.update([](MonorepoConfig& c) { c.root_path = "/elsewhere"; }), std::logic_error);
    EXPECT_EQ(store.load().root_path, root);
}

TEST_F(ConfigStoreTest, FailedMutationWritesNothing) {
    ConfigStore store(root);
    store.save(sample(root));

    EXPECT_THROW(store.update([](MonorepoConfig& c) {
        c.submodules.clear();
        throw std::runtime_error("abort");
    }), std::runtime_error);

    EXPECT_EQ(store.load(), sample(root));
}

TEST_F(ConfigStoreTest, ConcurrentUpdatesAreSerialized) {
    ConfigStore store(root);
    store.init();

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
        threads.emplace_back([&store, i] {
            store.update([i](MonorepoConfig& c) {
                c.submodules.push_back({"sub" + std::to_string(i), strategy::Mirror{}, {SyncRule::include("lib/***")}});
            });
        });
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.load().submodules.size(), static_cast<size_t>(kThreads));
}

TEST_F(ConfigStoreTest, ImportsLegacyJsonWithoutWriting) {
    fs::create_directories(root / ".monorepo");
    writeFile(root / ".monorepo" / "config.json", R"({
        "submodules": [
            {"name": "user_app", "path": "user_app",
             "include": ["lib/***", "pubspec.yaml", "test/***"], "exclude": ["*"]}
        ]
    })");

    ConfigStore store(root);
    EXPECT_TRUE(store.isInitialized());

    const auto cfg = store.load();
    EXPECT_EQ(cfg.root_path, root);
    ASSERT_EQ(cfg.submodules.size(), 1u);
    const std::vector expected{SyncRule::include("lib/***"), SyncRule::include("pubspec.yaml"),
                               SyncRule::include("test/***"), SyncRule::exclude("*")};
    EXPECT_EQ(cfg.submodules[0].rules, expected);
    EXPECT_FALSE(fs::exists(store.artifactPath()));

    store.update([](MonorepoConfig&) {});
    EXPECT_TRUE(fs::exists(store.artifactPath()));
    EXPECT_EQ(store.load(), cfg);
}

TEST_F(ConfigStoreTest, MalformedLegacyJsonIsCorrupt) {
    fs::create_directories(root / ".monorepo");
    writeFile(root / ".monorepo" / "config.json", "{\"submodules\": [ {\"include\": 3} ]}");

    ConfigStore store(root);
    try {
        (void)store.load();
        FAIL() << "legacy import accepted malformed JSON";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigCorrupt);
    }
}
