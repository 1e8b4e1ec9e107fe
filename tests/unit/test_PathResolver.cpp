#include "TempDir.hpp"
#include "paths/PathResolver.hpp"
#include "types/Error.hpp"

#include <functional>

using namespace ms::paths;
using namespace ms::types;

class PathResolverTest : public TempDirTest {};

static ErrorKind errorOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no ms::types::Error thrown";
    return ErrorKind::SyncFailed;
}

TEST_F(PathResolverTest, SiblingIsChildOfRootParent) {
    EXPECT_EQ(siblingPathFor(root, "user_app"), work / "user_app");
}

TEST_F(PathResolverTest, ResolvesExistingSibling) {
    makeSubmoduleDir("user_app");
    makeSiblingDir("user_app");

    const auto b = resolve(root, "user_app");
    EXPECT_EQ(b.submodule, "user_app");
    EXPECT_EQ(b.source, root / "user_app");
    EXPECT_EQ(b.sibling, work / "user_app");
}

TEST_F(PathResolverTest, MissingSiblingIsSiblingNotFound) {
    EXPECT_EQ(errorOf([&] { (void)resolve(root, "user_app"); }), ErrorKind::SiblingNotFound);
}

TEST_F(PathResolverTest, SiblingThatIsAFileIsSiblingNotFound) {
    writeFile(work / "user_app", "not a directory");
    EXPECT_EQ(errorOf([&] { (void)resolve(root, "user_app"); }), ErrorKind::SiblingNotFound);
}

TEST_F(PathResolverTest, ResolutionIsNotCached) {
    makeSiblingDir("user_app");
    EXPECT_NO_THROW((void)resolve(root, "user_app"));

    fs::remove_all(work / "user_app");
    EXPECT_EQ(errorOf([&] { (void)resolve(root, "user_app"); }), ErrorKind::SiblingNotFound);
}

TEST_F(PathResolverTest, RejectsTraversalAndSeparators) {
    for (const std::string bad : {"", ".", "..", "a/b", "../x", "a\\b"})
        EXPECT_EQ(errorOf([&] { (void)siblingPathFor(root, bad); }), ErrorKind::InvalidName) << "name: '" << bad << "'";
}

TEST_F(PathResolverTest, NameEqualToRootIsInvalid) {
    EXPECT_EQ(errorOf([&] { (void)siblingPathFor(root, "vendroo-monorepo"); }), ErrorKind::InvalidName);
}

TEST_F(PathResolverTest, ConfigDirectoryIsNotASubmoduleName) {
    fs::create_directories(root / ".monorepo");
    EXPECT_EQ(errorOf([&] { validateName(".monorepo"); }), ErrorKind::InvalidName);
    EXPECT_EQ(errorOf([&] { (void)isImmediateChildDir(root, ".monorepo"); }), ErrorKind::InvalidName);
    EXPECT_NO_THROW(validateName(".github"));
}

TEST_F(PathResolverTest, FilesystemRootHasNoSiblings) {
    EXPECT_EQ(errorOf([&] { (void)siblingPathFor("/", "user_app"); }), ErrorKind::SiblingNotFound);
}

TEST_F(PathResolverTest, TrailingSeparatorOnRootIsIgnored) {
    EXPECT_EQ(siblingPathFor(root.string() + "/", "user_app"), work / "user_app");
}

TEST_F(PathResolverTest, ImmediateChildDirectory) {
    makeSubmoduleDir("user_app");
    writeFile(root / "README.md", "hi");

    EXPECT_TRUE(isImmediateChildDir(root, "user_app"));
    EXPECT_FALSE(isImmediateChildDir(root, "README.md"));
    EXPECT_FALSE(isImmediateChildDir(root, "missing"));
}

TEST_F(PathResolverTest, FindsNearestMonorepoRoot) {
    fs::create_directories(root / ".monorepo");
    const auto deep = makeSubmoduleDir("user_app") / "lib" / "src";
    fs::create_directories(deep);

    const auto found = findMonorepoRoot(deep);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, root);

    const auto above = findMonorepoRoot(work);
    EXPECT_TRUE(!above || *above != root);
}
