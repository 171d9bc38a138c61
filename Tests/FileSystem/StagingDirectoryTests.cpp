#include <gtest/gtest.h>

#include <utility>

#include "StagingTestHelpers.h"
#include "FileSystem/FileError.h"
#include "FileSystem/StagingDirectory.h"

using namespace StagingEngine::Core::IO;
using staging::test_helpers::ScopedTempDir;
using staging::test_helpers::writeAllBytes;
using staging::test_helpers::permissionsOf;

namespace fs = std::filesystem;

TEST(StagingDirectory, CreatesPrivateDirectoryWithTaggedName) {
    ScopedTempDir tmp;
    auto staging = StagingDirectory::create(tmp.path(), "data.json");

    EXPECT_TRUE(fs::is_directory(staging.path()));
    EXPECT_EQ(staging.path().parent_path(), tmp.path());
    const auto name = staging.path().filename().string();
    EXPECT_EQ(name.rfind("data.json.tmp.", 0), 0u) << name;
    EXPECT_EQ(name.size(), std::string("data.json.tmp.").size() + 6);
    EXPECT_EQ(permissionsOf(staging.path()), fs::perms::owner_all);
    EXPECT_EQ(staging.filePath("data.json"), staging.path() / "data.json");
}

TEST(StagingDirectory, EachCreateIsUnique) {
    ScopedTempDir tmp;
    auto a = StagingDirectory::create(tmp.path(), "f");
    auto b = StagingDirectory::create(tmp.path(), "f");
    EXPECT_NE(a.path(), b.path());
}

TEST(StagingDirectory, DestructorRemovesContents) {
    ScopedTempDir tmp;
    fs::path where;
    {
        auto staging = StagingDirectory::create(tmp.path(), "f");
        where = staging.path();
        writeAllBytes(staging.filePath("f"), "payload");
        fs::create_directory(staging.path() / "nested");
    }
    EXPECT_FALSE(fs::exists(where));
}

TEST(StagingDirectory, RemoveIsIdempotent) {
    ScopedTempDir tmp;
    auto staging = StagingDirectory::create(tmp.path(), "f");
    auto where = staging.path();

    staging.remove();
    EXPECT_TRUE(staging.removed());
    EXPECT_FALSE(fs::exists(where));
    EXPECT_NO_THROW(staging.remove());
}

TEST(StagingDirectory, MoveTransfersOwnership) {
    ScopedTempDir tmp;
    auto first = StagingDirectory::create(tmp.path(), "f");
    auto where = first.path();

    StagingDirectory moved(std::move(first));
    EXPECT_TRUE(first.removed());
    EXPECT_EQ(moved.path(), where);
    EXPECT_TRUE(fs::exists(where));

    auto other = StagingDirectory::create(tmp.path(), "g");
    auto otherWhere = other.path();
    other = std::move(moved);
    EXPECT_FALSE(fs::exists(otherWhere));
    EXPECT_EQ(other.path(), where);
    EXPECT_TRUE(fs::exists(where));
}

TEST(StagingDirectory, MissingParentThrows) {
    ScopedTempDir tmp;
    try {
        StagingDirectory::create(tmp.join("absent"), "f");
        FAIL() << "expected FileSystemError";
    } catch (const FileSystemError& e) {
        EXPECT_EQ(e.code(), FileError::FileNotFound);
        EXPECT_EQ(e.path(), tmp.join("absent").string());
    }
}
