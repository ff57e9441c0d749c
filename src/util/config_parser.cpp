#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace repack::config {

namespace {

template <typename T>
void Override(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

} // namespace

void PipelineSettings::Reset() {
    *this = PipelineSettings{};
}

void PipelineSettings::MergeFrom(const PipelineSettings& other) {
    Override(source_archive, other.source_archive);
    Override(source_pattern, other.source_pattern);
    Override(workspace_dir, other.workspace_dir);
    Override(output_archive, other.output_archive);
    Override(archiver_path, other.archiver_path);
    Override(archiver_dialect, other.archiver_dialect);
    Override(scanner_path, other.scanner_path);
    Override(step_timeout_seconds, other.step_timeout_seconds);
    Override(force_clean_workspace, other.force_clean_workspace);
    Override(verify_output, other.verify_output);
    Override(report_path, other.report_path);
    Override(log_level, other.log_level);
}

Result PipelineConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    if (!detail::FillSettingsFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace repack::config
