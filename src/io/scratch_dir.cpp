#include "io/scratch_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace mdeploy {

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDir::~ScratchDir() {
    Cleanup();
}

void ScratchDir::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) LogWarn("cannot remove scratch directory %s: %s", path_.c_str(), ec.message().c_str());
    path_.clear();
}

Result ScratchDir::Create(const fs::path& base, const std::string& prefix, ScratchDir& out) {
    std::error_code ec;
    fs::create_directories(base, ec);

    std::string tmpl = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int err = errno;
        return Result::Fail(err, "mkdtemp failed under " + base.string() + ": " + std::strerror(err));
    }

    ScratchDir tmp;
    tmp.path_ = created;
    out = std::move(tmp);
    return Result::Ok();
}

} // namespace mdeploy
