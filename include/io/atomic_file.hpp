#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <sys/types.h>

namespace mdeploy {

// Writes `contents` to `<path>.tmp`, fsyncs, chmods to `mode` and renames over
// `path`. Readers observe either the old file or the new one.
Result WriteFileAtomic(const std::string& path, std::string_view contents, mode_t mode);

Result ReadFileToString(const std::string& path, std::string& out);

} // namespace mdeploy
