#include "pipeline/archive_path_policy.hpp"

#include "util/path_utils.hpp"

namespace repack {

bool IsContainedEntryPath(std::string_view p) {
    if (p.empty() || p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    std::size_t begin = 0;
    while (begin <= p.size()) {
        const std::size_t slash = p.find('/', begin);
        const std::size_t end = slash == std::string_view::npos ? p.size() : slash;
        if (p.substr(begin, end - begin) == "..") return false;
        if (slash == std::string_view::npos) break;
        begin = slash + 1;
    }
    return true;
}

Result CheckArchiveEntryPath(const char* raw_path, std::string& out_relative) {
    out_relative.clear();
    if (raw_path == nullptr || *raw_path == '\0') {
        return Result::Fail(-1, "archive entry without a name");
    }
    if (*raw_path == '/') {
        return Result::Fail(-1, std::string("absolute path in archive: ") + raw_path);
    }

    out_relative = NormalizeEntryPath(raw_path);
    if (out_relative.empty() || out_relative == ".") return Result::Ok();
    if (!IsContainedEntryPath(out_relative)) {
        return Result::Fail(-1, "entry escapes archive root: " + out_relative);
    }
    return Result::Ok();
}

} // namespace repack
