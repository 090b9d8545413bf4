#include "io/byte_source.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mdeploy {

Result FileSource::Open(const std::string& path, FileSource& out) {
    auto fd = Fd::Open(path, O_RDONLY);
    if (!fd) {
        return Result::Fail(fd.error(), "cannot open " + path + ": " + std::strerror(fd.error()));
    }

    struct stat st{};
    if (::fstat(fd->Get(), &st) != 0) {
        const int err = errno;
        return Result::Fail(err, "cannot stat " + path + ": " + std::strerror(err));
    }
    if (S_ISDIR(st.st_mode)) return Result::Fail(EISDIR, path + " is a directory");

    out.path_ = path;
    out.fd_ = std::move(*fd);
    out.size_ = S_ISREG(st.st_mode) ? std::optional<std::uint64_t>(st.st_size) : std::nullopt;
    return Result::Ok();
}

ssize_t FileSource::Read(std::span<std::uint8_t> out) {
    ssize_t n;
    do {
        n = ::read(fd_.Get(), out.data(), out.size());
    } while (n < 0 && errno == EINTR);
    return n;
}

Result DrainToString(IByteSource& src, std::string& out, std::uint64_t limit) {
    std::array<std::uint8_t, 16 * 1024> buf{};
    std::uint64_t total = 0;
    for (;;) {
        const ssize_t n = src.Read(buf);
        if (n == 0) return Result::Ok();
        if (n < 0) {
            const int err = errno;
            return Result::Fail(err, "read failed: " + src.Describe() + " (" + std::strerror(err) + ")");
        }
        total += static_cast<std::uint64_t>(n);
        if (total > limit) {
            return Result::Fail(EFBIG, src.Describe() + " exceeds " + std::to_string(limit) + " bytes");
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
}

} // namespace mdeploy
