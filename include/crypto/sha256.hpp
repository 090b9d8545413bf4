#pragma once

#include "io/byte_source.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace mdeploy {

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    // Empty string when the digest could not be computed.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string Sha256Hex(std::string_view data);
std::string Sha256Hex(IByteSource& src);

// Digest of a whole file, streamed. Error carries the path and reason.
std::expected<std::string, std::string> Sha256OfFile(const std::string& path);

} // namespace mdeploy
