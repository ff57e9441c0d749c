#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace repack {

// Reads a produced archive back with libarchive (any supported format).
class OutputVerifier {
  public:
    struct Summary {
        std::size_t entries = 0;
        std::vector<std::string> names;
    };

    // Fails when the archive cannot be opened, a header is unreadable, an
    // entry escapes the archive root, or the archive lists no entries.
    Result Verify(const std::string& archive_path, Summary& out) const;
};

} // namespace repack
