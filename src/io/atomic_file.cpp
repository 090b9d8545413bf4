#include "io/atomic_file.hpp"

#include "io/byte_source.hpp"
#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mdeploy {

namespace {

Result WriteAllToFd(int fd, std::string_view data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, std::string("write failed: ") + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

Result WriteFileAtomic(const std::string& path, std::string_view contents, mode_t mode) {
    const std::string tmp_path = path + ".tmp";

    auto opened = Fd::Open(tmp_path, O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (!opened) {
        return Result::Fail(opened.error(), "cannot create " + tmp_path + ": " + std::strerror(opened.error()));
    }
    Fd fd = std::move(*opened);

    auto wr = WriteAllToFd(fd.Get(), contents);
    if (!wr.is_ok()) {
        fd.Close();
        ::unlink(tmp_path.c_str());
        return wr;
    }
    if (::fchmod(fd.Get(), mode) != 0 || ::fsync(fd.Get()) != 0) {
        const int err = errno;
        fd.Close();
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "cannot finalize " + tmp_path + ": " + std::strerror(err));
    }
    if (const int err = fd.Close(); err != 0) {
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "cannot close " + tmp_path + ": " + std::strerror(err));
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }
    return Result::Ok();
}

Result ReadFileToString(const std::string& path, std::string& out) {
    FileSource src;
    if (auto r = FileSource::Open(path, src); !r.is_ok()) return r;
    out.clear();
    return DrainToString(src, out);
}

} // namespace mdeploy
