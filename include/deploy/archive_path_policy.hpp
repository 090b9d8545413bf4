#pragma once

#include "util/result.hpp"

#include <string>

namespace mdeploy {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeLinkTarget(const char* raw_path, std::string& out_relative) const;
    // Symlink targets stay relative to the link; they may not climb out of the tree.
    Result CheckSymlinkTarget(const std::string& entry_relative, const char* target) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);

    bool safe_paths_only_ = true;
};

} // namespace mdeploy
