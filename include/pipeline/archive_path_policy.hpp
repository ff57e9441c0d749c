#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace repack {

// True when p is relative and no segment climbs out with "..".
bool IsContainedEntryPath(std::string_view p);

// Normalizes an archive entry name into out_relative. Absolute names and
// names escaping the archive root are rejected.
Result CheckArchiveEntryPath(const char* raw_path, std::string& out_relative);

} // namespace repack
