#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "StagingCore.h"

using namespace StagingEngine::Core;
using namespace StagingEngine::Core::IO;

static std::filesystem::path makeTempTarget(const std::string& base) {
    auto dir = std::filesystem::temp_directory_path() / "staging_basics";
    return dir / "nested" / (base + ".txt");
}

static std::string readBack(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main() {
    const auto path = makeTempTarget("atomic_basics");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    // Publish a file in one call; parent directories are created as needed
    try {
        atomicWrite(path, [](const std::filesystem::path& staged) {
            std::ofstream out(staged, std::ios::binary);
            out << "Hello, AtomicWriter!";
        });
    } catch (const FileSystemError& e) {
        STAGING_LOG_ERROR(std::string("atomicWrite failed: ") + e.what());
        return 1;
    }
    STAGING_LOG_INFO("Wrote: " + readBack(path) + " to " + path.string());

    // Without overwrite the existing file is kept
    try {
        atomicWrite(path, [](const std::filesystem::path& staged) {
            std::ofstream out(staged, std::ios::binary);
            out << "replacement";
        });
        STAGING_LOG_ERROR("second write should have been refused");
        return 1;
    } catch (const DestinationExistsError& e) {
        STAGING_LOG_INFO(std::string("Refused as expected: ") + e.what());
    }

    // Handle form with overwrite and custom permissions
    AtomicWriteOptions opts;
    opts.overwrite = true;
    opts.filePermissions = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                           std::filesystem::perms::group_read;
    try {
        AtomicWriter writer(path, opts);
        {
            std::ofstream out(writer.stagingPath(), std::ios::binary);
            out << "Replaced atomically";
        }
        writer.commit();
    } catch (const FileSystemError& e) {
        STAGING_LOG_ERROR(std::string("commit failed: ") + e.what());
        return 1;
    }
    STAGING_LOG_INFO("Read: " + readBack(path));

    std::filesystem::remove_all(path.parent_path().parent_path(), ec);
    STAGING_LOG_INFO("Removed: " + path.string());
    return 0;
}
