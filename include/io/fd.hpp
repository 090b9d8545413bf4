#pragma once

#include <expected>
#include <string>
#include <sys/types.h>

namespace mdeploy {

// Owns a file descriptor and closes it on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}

    // O_CLOEXEC is always added. The error is the errno of open(2).
    static std::expected<Fd, int> Open(const std::string& path, int flags, mode_t mode = 0);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.Release()) {}
    Fd& operator=(Fd&& other) noexcept;
    ~Fd() { Close(); }

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Gives up ownership without closing.
    int Release();
    // Returns the errno of close(2), 0 on success or when nothing was held.
    int Close();

  private:
    int fd_{-1};
};

} // namespace mdeploy
