#include <gtest/gtest.h>

#include <cerrno>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include "StagingTestHelpers.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileProperties.h"

using namespace StagingEngine::Core::IO;
using staging::test_helpers::ScopedTempDir;
using staging::test_helpers::writeAllBytes;
using staging::test_helpers::permissionsOf;

namespace fs = std::filesystem;

TEST(FileProperties, EnsureDirectoryReportsCreation) {
    ScopedTempDir tmp;
    auto dir = tmp.join("fresh");

    auto first = ensureDirectory(dir);
    EXPECT_EQ(first.result, DirectoryProvisionResult::Created);
    EXPECT_FALSE(first.error);
    EXPECT_TRUE(fs::is_directory(dir));

    auto second = ensureDirectory(dir);
    EXPECT_EQ(second.result, DirectoryProvisionResult::AlreadyPresent);
}

TEST(FileProperties, EnsureDirectoryToleratesNonDirectoryInPlace) {
    ScopedTempDir tmp;
    auto file = tmp.join("occupied");
    writeAllBytes(file, "x");

    auto provision = ensureDirectory(file);
    EXPECT_EQ(provision.result, DirectoryProvisionResult::AlreadyPresent);
    EXPECT_TRUE(fs::is_regular_file(file));
}

TEST(FileProperties, EnsureDirectoryFailsWithoutParent) {
    ScopedTempDir tmp;
    auto provision = ensureDirectory(tmp.join("missing/child"));
    EXPECT_EQ(provision.result, DirectoryProvisionResult::Failed);
    EXPECT_EQ(provision.error.value(), ENOENT);
}

TEST(FileProperties, EnsureDirectoryRootIsAlreadyPresent) {
    EXPECT_EQ(ensureDirectory("/").result, DirectoryProvisionResult::AlreadyPresent);
}

TEST(FileProperties, ApplyPropertiesReplacesModeBits) {
    ScopedTempDir tmp;
    auto file = tmp.join("file");
    writeAllBytes(file, "x");
    fs::permissions(file, fs::perms::all);

    applyProperties(file, fs::perms::owner_read | fs::perms::group_read, Ownership{});
    EXPECT_EQ(permissionsOf(file), fs::perms::owner_read | fs::perms::group_read);
}

TEST(FileProperties, ApplyPropertiesOnMissingPathThrows) {
    ScopedTempDir tmp;
    try {
        applyProperties(tmp.join("nope"), fs::perms::owner_all, Ownership{});
        FAIL() << "expected FileSystemError";
    } catch (const FileSystemError& e) {
        EXPECT_EQ(e.code(), FileError::FileNotFound);
    }
}

TEST(FileProperties, ApplyPropertiesWithCurrentOwnership) {
    ScopedTempDir tmp;
    auto file = tmp.join("file");
    writeAllBytes(file, "x");

    Ownership owner;
    owner.uid = ::geteuid();
    owner.gid = ::getegid();
    EXPECT_NO_THROW(applyProperties(file, fs::perms::owner_read | fs::perms::owner_write, owner));

    struct stat st {};
    ASSERT_EQ(::stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, ::geteuid());
    EXPECT_EQ(st.st_gid, ::getegid());
}

TEST(FileProperties, ApplyPropertiesForeignOwnerIsDenied) {
    if (staging::test_helpers::runningAsRoot()) {
        GTEST_SKIP() << "root may change ownership freely";
    }
    ScopedTempDir tmp;
    auto file = tmp.join("file");
    writeAllBytes(file, "x");

    Ownership owner;
    owner.uid = 0;
    try {
        applyProperties(file, fs::perms::owner_read | fs::perms::owner_write, owner);
        FAIL() << "expected FileSystemError";
    } catch (const FileSystemError& e) {
        EXPECT_EQ(e.code(), FileError::AccessDenied);
        EXPECT_EQ(e.path(), file.string());
    }
}

TEST(FileProperties, ResolveOwnershipByName) {
    auto owner = resolveOwnership(staging::test_helpers::currentUserName(),
                                  staging::test_helpers::currentGroupName());
    ASSERT_TRUE(owner.uid.has_value());
    ASSERT_TRUE(owner.gid.has_value());
    EXPECT_EQ(*owner.uid, ::geteuid());
    EXPECT_EQ(*owner.gid, ::getegid());
}

TEST(FileProperties, ResolveOwnershipAcceptsNumericIds) {
    auto owner = resolveOwnership(std::string("4242"), std::nullopt);
    ASSERT_TRUE(owner.uid.has_value());
    EXPECT_EQ(*owner.uid, 4242u);
    EXPECT_FALSE(owner.gid.has_value());
    EXPECT_FALSE(owner.empty());
}

TEST(FileProperties, ResolveOwnershipNothingRequested) {
    EXPECT_TRUE(resolveOwnership(std::nullopt, std::nullopt).empty());
}

TEST(FileProperties, ResolveOwnershipUnknownNames) {
    try {
        resolveOwnership(std::string("no-such-user-for-staging-tests"), std::nullopt);
        FAIL() << "expected FileSystemError";
    } catch (const FileSystemError& e) {
        EXPECT_EQ(e.code(), FileError::InvalidArgument);
        EXPECT_EQ(e.path(), "no-such-user-for-staging-tests");
    }
    EXPECT_THROW(resolveOwnership(std::nullopt, std::string("no-such-group-for-staging-tests")), FileSystemError);
}

TEST(FileProperties, SyncHelpers) {
    ScopedTempDir tmp;
    auto file = tmp.join("file");
    writeAllBytes(file, "durable");

    EXPECT_NO_THROW(syncFile(file));
    EXPECT_NO_THROW(syncDirectory(tmp.path()));
    EXPECT_THROW(syncFile(tmp.join("absent")), FileSystemError);
    EXPECT_THROW(syncDirectory(file), FileSystemError);
}

TEST(FileError, ErrnoMapping) {
    EXPECT_EQ(fileErrorFromErrno(ENOENT), FileError::FileNotFound);
    EXPECT_EQ(fileErrorFromErrno(EACCES), FileError::AccessDenied);
    EXPECT_EQ(fileErrorFromErrno(EPERM), FileError::AccessDenied);
    EXPECT_EQ(fileErrorFromErrno(ENOSPC), FileError::DiskFull);
    EXPECT_EQ(fileErrorFromErrno(EEXIST), FileError::AlreadyExists);
    EXPECT_EQ(fileErrorFromErrno(ENOTDIR), FileError::InvalidPath);
    EXPECT_EQ(fileErrorFromErrno(EIO), FileError::IOError);
    EXPECT_EQ(fileErrorFromErrno(ENOTEMPTY), FileError::IOError);
}

TEST(FileError, CodeNames) {
    EXPECT_EQ(toString(FileError::AlreadyExists), "AlreadyExists");
    EXPECT_EQ(toString(FileError::AccessDenied), "AccessDenied");
    EXPECT_EQ(toString(FileError::IOError), "IOError");
}

TEST(FileError, DestinationExistsMessageNamesThePath) {
    DestinationExistsError err("/srv/data/out.bin");
    EXPECT_EQ(err.code(), FileError::AlreadyExists);
    ASSERT_TRUE(err.systemError().has_value());
    EXPECT_EQ(*err.systemError(), std::make_error_code(std::errc::file_exists));

    const std::string what = err.what();
    EXPECT_EQ(what.rfind("Destination already exists: /srv/data/out.bin", 0), 0u) << what;
}

TEST(FileError, ErrnoErrorCarriesSystemCode) {
    auto err = makeErrnoError(EACCES, "Cannot open", "/x");
    EXPECT_EQ(err.code(), FileError::AccessDenied);
    EXPECT_EQ(err.info().message, "Cannot open");
    ASSERT_TRUE(err.systemError().has_value());
    EXPECT_EQ(err.systemError()->value(), EACCES);
}
