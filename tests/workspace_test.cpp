#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include <unistd.h>

#include "sandbox/workspace.hpp"
#include "test_support.hpp"

using runbox::sandbox::Workspace;
using runbox::sandbox::WorkspaceError;
using runbox::testing::ReadAll;
using runbox::testing::TempDir;

TEST(Workspace, CreatesUniqueDirectoriesUnderRoot) {
    TempDir root;
    auto first = Workspace::Create(root.Path() / "nested");
    auto second = Workspace::Create(root.Path() / "nested");
    EXPECT_NE(first.Path(), second.Path());
    EXPECT_TRUE(std::filesystem::is_directory(first.Path()));
    EXPECT_TRUE(std::filesystem::is_directory(second.Path()));
    EXPECT_EQ(first.Path().parent_path(), root.Path() / "nested");
    EXPECT_EQ(first.Path().filename().string().rfind("run_", 0), 0u);
}

TEST(Workspace, DirectoryIsOwnerOnly) {
    TempDir root;
    auto workspace = Workspace::Create(root.Path());
    const auto perms = std::filesystem::status(workspace.Path()).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::others_all, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::group_all, std::filesystem::perms::none);
}

TEST(Workspace, WriteSourceIsVerbatim) {
    TempDir root;
    auto workspace = Workspace::Create(root.Path());
    const std::string code = std::string("print('../../etc/passwd')\r\n\ttab") + '\0' + "tail";
    const auto path = workspace.WriteSource(code, ".py");
    EXPECT_EQ(path.parent_path(), workspace.Path());
    EXPECT_EQ(path.filename(), "program.py");
    EXPECT_EQ(ReadAll(path), code);
    EXPECT_EQ(workspace.BinaryPath(), workspace.Path() / "program");
}

TEST(Workspace, DestructorRemovesEverything) {
    TempDir root;
    std::filesystem::path path;
    {
        auto workspace = Workspace::Create(root.Path());
        path = workspace.Path();
        workspace.WriteSource("int main() {}", ".c");
        std::filesystem::create_directories(path / "deep" / "er");
        std::ofstream(path / "deep" / "er" / "artifact") << "x";
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::is_empty(root.Path()));
}

TEST(Workspace, DestroyIsIdempotent) {
    TempDir root;
    auto workspace = Workspace::Create(root.Path());
    const auto path = workspace.Path();
    workspace.Destroy();
    EXPECT_FALSE(std::filesystem::exists(path));
    workspace.Destroy();
    EXPECT_TRUE(workspace.Path().empty());
}

TEST(Workspace, MoveTransfersOwnership) {
    TempDir root;
    auto original = Workspace::Create(root.Path());
    const auto path = original.Path();
    {
        Workspace moved = std::move(original);
        EXPECT_EQ(moved.Path(), path);
        EXPECT_TRUE(original.Path().empty());
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(Workspace, RemovedWhenExceptionUnwinds) {
    TempDir root;
    std::filesystem::path path;
    try {
        auto workspace = Workspace::Create(root.Path());
        path = workspace.Path();
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(Workspace, CreateFailsWhenRootIsAFile) {
    TempDir root;
    const auto blocker = root.Path() / "not-a-directory";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(Workspace::Create(blocker), WorkspaceError);
    EXPECT_THROW(Workspace::Create(blocker / "child"), WorkspaceError);
}

TEST(Workspace, RemovedEvenWhenUserCodeLockedSubdirectories) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    TempDir root;
    std::filesystem::path path;
    {
        auto workspace = Workspace::Create(root.Path());
        path = workspace.Path();
        const auto locked = path / "locked";
        std::filesystem::create_directories(locked / "inner");
        std::ofstream(locked / "inner" / "file") << "x";
        const auto read_only = path / "read_only";
        std::filesystem::create_directory(read_only);
        std::ofstream(read_only / "file") << "x";

        std::filesystem::permissions(locked / "inner", std::filesystem::perms::none);
        std::filesystem::permissions(locked, std::filesystem::perms::none);
        std::filesystem::permissions(read_only, std::filesystem::perms::owner_read
                                                    | std::filesystem::perms::owner_exec);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::is_empty(root.Path()));
}
