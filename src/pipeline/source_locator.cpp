#include "pipeline/source_locator.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <system_error>

namespace fs = std::filesystem;

namespace repack {

namespace {

fs::path Comparable(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return p.lexically_normal();
    return abs.lexically_normal();
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

Result SourceLocator::FindMatches(const SourceQuery& query, std::vector<std::string>& out) {
    out.clear();
    if (query.pattern.empty())
        return Result::Fail(-1, "source pattern is empty");

    const fs::path dir(query.search_dir.empty() ? std::string(".") : query.search_dir);

    std::vector<fs::path> excluded;
    excluded.reserve(query.excluded.size());
    for (const auto& e : query.excluded) {
        if (!e.empty()) excluded.push_back(Comparable(e));
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot list " + dir.string() + ": " + ec.message());
    }

    fs::directory_iterator end;
    while (it != end) {
        const fs::path candidate = it->path();
        const std::string name = candidate.filename().string();

        std::error_code st_ec;
        const bool regular = fs::is_regular_file(candidate, st_ec);
        if (regular && !st_ec && ::fnmatch(query.pattern.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            const bool skip = std::find(excluded.begin(), excluded.end(), Comparable(candidate)) !=
                              excluded.end();
            if (skip) {
                LogDebug("source: skipping excluded %s", candidate.string().c_str());
            } else {
                out.push_back((dir / name).lexically_normal().string());
            }
        }

        it.increment(ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot list " + dir.string() + ": " + ec.message());
        }
    }

    std::sort(out.begin(), out.end());
    return Result::Ok();
}

Result SourceLocator::Resolve(const SourceQuery& query, std::string& out_path) {
    out_path.clear();
    if (!query.explicit_path.empty()) {
        out_path = query.explicit_path;
        return Result::Ok();
    }

    std::vector<std::string> matches;
    auto find_result = FindMatches(query, matches);
    if (!find_result.is_ok())
        return find_result;

    if (matches.size() != 1) {
        std::string msg = "expected exactly one match for '" + query.pattern + "' in " +
                          (query.search_dir.empty() ? std::string(".") : query.search_dir) +
                          ", found " + std::to_string(matches.size());
        if (!matches.empty()) msg += ": " + JoinNames(matches);
        return Result::Fail(-1, msg);
    }

    out_path = matches.front();
    LogInfo("Source archive: %s (matched '%s')", out_path.c_str(), query.pattern.c_str());
    return Result::Ok();
}

} // namespace repack
