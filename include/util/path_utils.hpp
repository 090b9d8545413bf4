#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mdeploy {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// First path component of a normalized relative path ("a/b/c" -> "a").
inline std::string_view FirstComponent(std::string_view rel) {
    const auto pos = rel.find('/');
    return pos == std::string_view::npos ? rel : rel.substr(0, pos);
}

// Guard for recursive removal: absolute, normalized, at least two levels deep.
inline bool IsSafeRemovalTarget(const std::filesystem::path& p) {
    if (!p.is_absolute()) return false;
    const auto n = p.lexically_normal();
    int depth = 0;
    for (const auto& part : n.relative_path()) {
        if (part.empty() || part == ".") continue;
        if (part == "..") return false;
        ++depth;
    }
    return depth >= 2;
}

} // namespace mdeploy
