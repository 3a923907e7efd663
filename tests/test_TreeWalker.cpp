#include "SandboxTest.h"
#include "fs/TreeWalker.h"
#include "security/PathGuard.h"

class TreeWalkerTest : public SandboxTest {
protected:
    void SetUp() override {
        SandboxTest::SetUp();
        guard = std::make_unique<PathGuard>(config);
        walker = std::make_unique<TreeWalker>(*guard);
    }

    std::unique_ptr<PathGuard> guard;
    std::unique_ptr<TreeWalker> walker;
};

TEST_F(TreeWalkerTest, DirectoriesComeFirst) {
    writeFile("a.txt", "a");
    writeFile("src/main.cpp", "int main() {}");
    writeFile("docs/readme.md", "# r");

    TreeResult tree = walker->walk(root.u8string(), 3);
    ASSERT_EQ(tree.root.children.size(), 3u);
    EXPECT_EQ(tree.root.children[0].name, "docs");
    EXPECT_EQ(tree.root.children[1].name, "src");
    EXPECT_EQ(tree.root.children[2].name, "a.txt");
    ASSERT_EQ(tree.root.children[1].children.size(), 1u);
    EXPECT_EQ(tree.root.children[1].children[0].name, "main.cpp");
    EXPECT_EQ(tree.count, 5u);
    EXPECT_FALSE(tree.truncated);
}

TEST_F(TreeWalkerTest, DepthLimitStopsExpansion) {
    writeFile("l1/l2/l3/deep.txt", "x");

    TreeResult shallow = walker->walk(root.u8string(), 0);
    ASSERT_EQ(shallow.root.children.size(), 1u);
    EXPECT_EQ(shallow.root.children[0].name, "l1");
    EXPECT_TRUE(shallow.root.children[0].children.empty());

    TreeResult two = walker->walk(root.u8string(), 1);
    const TreeNode& l1 = two.root.children[0];
    ASSERT_EQ(l1.children.size(), 1u);
    EXPECT_EQ(l1.children[0].name, "l2");
    EXPECT_TRUE(l1.children[0].children.empty());
}

TEST_F(TreeWalkerTest, HiddenEntriesSkippedUnlessRequested) {
    writeFile(".git/config", "x");
    writeFile("visible.txt", "x");

    TreeResult tree = walker->walk(root.u8string(), 3);
    ASSERT_EQ(tree.root.children.size(), 1u);
    EXPECT_EQ(tree.root.children[0].name, "visible.txt");

    TreeResult all = walker->walk(root.u8string(), 3, true);
    EXPECT_EQ(all.root.children.size(), 2u);
    EXPECT_EQ(all.root.children[0].name, ".git");
}

TEST_F(TreeWalkerTest, SymlinksAreNotFollowed) {
    writeFile(base / "outside/secret.txt", "secret");
    fs::create_directory_symlink(base / "outside", root / "escape");

    TreeResult tree = walker->walk(root.u8string(), 5);
    ASSERT_EQ(tree.root.children.size(), 1u);
    EXPECT_EQ(tree.root.children[0].kind, EntryKind::Symlink);
    EXPECT_TRUE(tree.root.children[0].children.empty());
}

TEST_F(TreeWalkerTest, TruncatesAtEntryCap) {
    for (int d = 0; d < 11; ++d) {
        fs::path dir = root / ("d" + std::to_string(d));
        fs::create_directories(dir);
        for (int f = 0; f < 100; ++f) {
            std::ofstream(dir / ("f" + std::to_string(f))) << "";
        }
    }
    TreeResult tree = walker->walk(root.u8string(), 3);
    EXPECT_TRUE(tree.truncated);
    EXPECT_EQ(tree.count, TreeWalker::kMaxTreeEntries);

    std::string text = TreeWalker::render(tree);
    EXPECT_NE(text.find("truncated"), std::string::npos);
}

TEST_F(TreeWalkerTest, RenderDrawsConnectors) {
    writeFile("src/main.cpp", "12345");
    writeFile("z.txt", "");

    std::string text = TreeWalker::render(walker->walk(root.u8string(), 2));
    std::string expected = root.u8string() + "/\n"
                           "├── src/\n"
                           "│   └── main.cpp (5 B)\n"
                           "└── z.txt (0 B)\n";
    EXPECT_EQ(text, expected);
}

TEST_F(TreeWalkerTest, WalkRejectsFilesAndOutsidePaths) {
    fs::path file = writeFile("f.txt", "x");
    EXPECT_FS_ERROR(walker->walk(file.u8string(), 1), ErrorKind::NotADirectory);
    EXPECT_FS_ERROR(walker->walk(base.u8string(), 1), ErrorKind::AccessDenied);
}

TEST_F(TreeWalkerTest, VisitReportsRelativePathsAndStops) {
    writeFile("a/b/c.txt", "x");
    writeFile("a/d.txt", "x");

    std::vector<std::string> seen;
    walker->visit(root, 5, false, [&](const VisitEntry& e) {
        seen.push_back(e.relativePath + "@" + std::to_string(e.depth));
        return true;
    });
    std::vector<std::string> expected = {"a@0", "a/b@1", "a/b/c.txt@2", "a/d.txt@1"};
    EXPECT_EQ(seen, expected);

    size_t calls = 0;
    walker->visit(root, 5, false, [&](const VisitEntry&) { return ++calls < 2; });
    EXPECT_EQ(calls, 2u);
}
