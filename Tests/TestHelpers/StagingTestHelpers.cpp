#include "StagingTestHelpers.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

namespace staging::test_helpers {

ScopedEnv::ScopedEnv(const char* name, const std::string& value) : _name(name) {
    if (const char* old = std::getenv(name)) _previous = std::string(old);
    ::setenv(name, value.c_str(), 1);
}

ScopedEnv::~ScopedEnv() {
    if (_previous) {
        ::setenv(_name.c_str(), _previous->c_str(), 1);
    } else {
        ::unsetenv(_name.c_str());
    }
}

ScopedCurrentPath::ScopedCurrentPath(const std::filesystem::path& dir)
    : _previous(std::filesystem::current_path()) {
    std::filesystem::current_path(dir);
}

ScopedCurrentPath::~ScopedCurrentPath() {
    std::error_code ec;
    std::filesystem::current_path(_previous, ec);
}

std::string readAllBytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeAllBytes(const std::filesystem::path& p, const std::string& bytes) {
    std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::filesystem::perms permissionsOf(const std::filesystem::path& p) {
    return std::filesystem::status(p).permissions() & std::filesystem::perms::mask;
}

std::vector<std::filesystem::path> stagingLeftovers(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
            found.push_back(entry.path());
        }
    }
    return found;
}

std::string currentUserName() {
    struct passwd* pw = ::getpwuid(::geteuid());
    return pw ? std::string(pw->pw_name) : std::to_string(::geteuid());
}

std::string currentGroupName() {
    struct group* gr = ::getgrgid(::getegid());
    return gr ? std::string(gr->gr_name) : std::to_string(::getegid());
}

bool runningAsRoot() {
    return ::geteuid() == 0;
}

} // namespace staging::test_helpers
