#pragma once

#include "io/byte_source.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace mdeploy {

struct ExtractStats {
    std::uint64_t entries = 0;
    std::uint64_t bytes = 0;
    // First path component of every extracted entry.
    std::set<std::string> top_level;
};

// Extracts a (possibly compressed) tar stream below a destination directory
// with libarchive. Absolute paths, ".." components and escaping symlinks are
// rejected before anything is written for that entry.
class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        bool restore_owner = false;
        std::uint64_t progress_interval_bytes = 8 * 1024 * 1024ULL;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractToDir(IByteSource& archive_stream,
                        const std::string& dst_dir,
                        std::string_view tag,
                        ExtractStats* stats = nullptr) const;

  private:
    Options opt_{};
};

} // namespace mdeploy
