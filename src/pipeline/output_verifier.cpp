#include "pipeline/output_verifier.hpp"

#include "pipeline/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace repack {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

} // namespace

Result OutputVerifier::Verify(const std::string& archive_path, Summary& out) const {
    out = Summary{};

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        return Result::Fail(-1, "cannot open " + archive_path + ": " + ArchiveErr(ar.get()));
    }

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("%s: %s", archive_path.c_str(), ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = CheckArchiveEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;

        if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar.get()));
        }

        LogDebug("verify entry: %s", rel.c_str());
        out.names.push_back(std::move(rel));
        ++out.entries;
    }

    if (out.entries == 0) {
        return Result::Fail(-1, "archive " + archive_path + " lists no entries");
    }
    return Result::Ok();
}

} // namespace repack
