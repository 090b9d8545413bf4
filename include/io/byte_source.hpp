#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace mdeploy {

// Sequential byte stream consumed by the hasher and the archive extractor.
class IByteSource {
public:
    virtual ~IByteSource() = default;

    // Bytes read, 0 at end of stream, -1 with errno set on failure.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> SizeHint() const { return std::nullopt; }
    // Used in error messages.
    virtual std::string Describe() const = 0;
};

class FileSource final : public IByteSource {
public:
    static Result Open(const std::string& path, FileSource& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> SizeHint() const override { return size_; }
    std::string Describe() const override { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Appends the rest of `src` to `out`. Fails once more than `limit` bytes
// have been read.
Result DrainToString(IByteSource& src, std::string& out, std::uint64_t limit = 64ULL << 20);

} // namespace mdeploy
