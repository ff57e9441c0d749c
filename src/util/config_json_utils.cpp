#include "util/config_json_utils.hpp"

#include <cstdint>
#include <fstream>

namespace repack::config::detail {

namespace {

// The Get*IfPresent helpers return false only for a present key of the wrong type.

bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an unsigned integer";
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->get<std::int64_t>() < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j,
                      const char* key,
                      std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillSettingsFromJson(const nlohmann::json& j, PipelineSettings& cfg, std::string& err) {
    return GetStringIfPresent(j, "SourceArchive", cfg.source_archive, err) &&
           GetStringIfPresent(j, "SourcePattern", cfg.source_pattern, err) &&
           GetStringIfPresent(j, "WorkspaceDir", cfg.workspace_dir, err) &&
           GetStringIfPresent(j, "OutputArchive", cfg.output_archive, err) &&
           GetStringIfPresent(j, "ArchiverPath", cfg.archiver_path, err) &&
           GetStringIfPresent(j, "ArchiverDialect", cfg.archiver_dialect, err) &&
           GetStringIfPresent(j, "ScannerPath", cfg.scanner_path, err) &&
           GetU64IfPresent(j, "StepTimeoutSeconds", cfg.step_timeout_seconds, err) &&
           GetBoolIfPresent(j, "ForceCleanWorkspace", cfg.force_clean_workspace, err) &&
           GetBoolIfPresent(j, "VerifyOutput", cfg.verify_output, err) &&
           GetStringIfPresent(j, "ReportPath", cfg.report_path, err) &&
           GetStringIfPresent(j, "LogLevel", cfg.log_level, err);
}

} // namespace repack::config::detail
