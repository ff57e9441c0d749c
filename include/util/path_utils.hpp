#pragma once

#include <string>
#include <string_view>

namespace repack {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeEntryPath(std::string s) {
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

// "out/result.7z" -> "out/result.partial.7z", "result" -> "result.partial".
inline std::string StagingPathFor(std::string_view output_path) {
    const std::string path(output_path);
    const auto slash = path.rfind('/');
    const auto dot = path.rfind('.');
    const bool has_ext = dot != std::string::npos && dot > 0 &&
                         (slash == std::string::npos || dot > slash + 1);
    if (!has_ext) return path + ".partial";
    return path.substr(0, dot) + ".partial" + path.substr(dot);
}

} // namespace repack
