#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace repack {

struct SourceQuery {
    std::string explicit_path;
    std::string pattern = "*.7z";
    std::string search_dir = ".";
    // Never selected, e.g. the output archive of a previous run.
    std::vector<std::string> excluded;
};

class SourceLocator {
  public:
    // explicit_path wins as-is. Otherwise exactly one regular file in
    // search_dir must match pattern (shell glob, leading dots not matched).
    static Result Resolve(const SourceQuery& query, std::string& out_path);

    static Result FindMatches(const SourceQuery& query, std::vector<std::string>& out);
};

} // namespace repack
