#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>

namespace mdeploy {

// mkdtemp directory, removed recursively on destruction.
class ScratchDir {
  public:
    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ~ScratchDir();

    static Result Create(const std::filesystem::path& base, const std::string& prefix, ScratchDir& out);

    const std::filesystem::path& Path() const { return path_; }

  private:
    void Cleanup();

    std::filesystem::path path_;
};

} // namespace mdeploy
