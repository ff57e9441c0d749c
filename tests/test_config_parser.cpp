#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config_parser.hpp"

#include <string>

namespace repack::config {
namespace {

TEST(PipelineConfigTest, LoadsAllKeys) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("repack.json");
    ASSERT_TRUE(testutil::WriteTextFile(path, R"({
        "SourceArchive": "in.7z",
        "SourcePattern": "*.zip",
        "WorkspaceDir": "ws",
        "OutputArchive": "out.7z",
        "ArchiverPath": "/usr/bin/7za",
        "ArchiverDialect": "7z",
        "ScannerPath": "/opt/scanner",
        "StepTimeoutSeconds": 600,
        "ForceCleanWorkspace": false,
        "VerifyOutput": true,
        "ReportPath": "report.json",
        "LogLevel": "debug",
        "SomethingElse": [1, 2, 3]
    })"));

    PipelineConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(*cfg.source_archive, "in.7z");
    EXPECT_EQ(*cfg.source_pattern, "*.zip");
    EXPECT_EQ(*cfg.workspace_dir, "ws");
    EXPECT_EQ(*cfg.output_archive, "out.7z");
    EXPECT_EQ(*cfg.archiver_path, "/usr/bin/7za");
    EXPECT_EQ(*cfg.archiver_dialect, "7z");
    EXPECT_EQ(*cfg.scanner_path, "/opt/scanner");
    EXPECT_EQ(*cfg.step_timeout_seconds, 600u);
    EXPECT_FALSE(*cfg.force_clean_workspace);
    EXPECT_TRUE(*cfg.verify_output);
    EXPECT_EQ(*cfg.report_path, "report.json");
    EXPECT_EQ(*cfg.log_level, "debug");
}

TEST(PipelineConfigTest, AbsentKeysStayUnset) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("repack.json");
    ASSERT_TRUE(testutil::WriteTextFile(path, R"({"ScannerPath": "./scan"})"));

    PipelineConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(path).is_ok());
    EXPECT_EQ(*cfg.scanner_path, "./scan");
    EXPECT_FALSE(cfg.workspace_dir.has_value());
    EXPECT_FALSE(cfg.step_timeout_seconds.has_value());
}

TEST(PipelineConfigTest, WrongTypesAreRejected) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("repack.json");

    struct Case {
        const char* json;
        const char* expected;
    };
    const Case cases[] = {
        {R"({"WorkspaceDir": 5})", "WorkspaceDir must be a string"},
        {R"({"StepTimeoutSeconds": "10"})", "StepTimeoutSeconds must be an unsigned integer"},
        {R"({"StepTimeoutSeconds": 1.5})", "StepTimeoutSeconds must be an unsigned integer"},
        {R"({"StepTimeoutSeconds": -3})", "StepTimeoutSeconds must not be negative"},
        {R"({"VerifyOutput": "yes"})", "VerifyOutput must be true or false"},
    };

    for (const auto& c : cases) {
        ASSERT_TRUE(testutil::WriteTextFile(path, c.json));
        PipelineConfigFromFile cfg;
        auto r = cfg.LoadFile(path);
        EXPECT_FALSE(r.is_ok()) << c.json;
        EXPECT_NE(r.msg.find(c.expected), std::string::npos) << r.msg;
        EXPECT_FALSE(cfg.workspace_dir.has_value());
    }
}

TEST(PipelineConfigTest, ReadsFullUnsignedRange) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("repack.json");
    ASSERT_TRUE(testutil::WriteTextFile(path, R"({"StepTimeoutSeconds": 18446744073709551615})"));

    PipelineConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(*cfg.step_timeout_seconds, 18446744073709551615ULL);
}

TEST(PipelineConfigTest, RejectsMalformedFiles) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("repack.json");
    PipelineConfigFromFile cfg;

    ASSERT_TRUE(testutil::WriteTextFile(path, "{ not json"));
    auto invalid = cfg.LoadFile(path);
    EXPECT_FALSE(invalid.is_ok());
    EXPECT_NE(invalid.msg.find("invalid JSON"), std::string::npos);

    ASSERT_TRUE(testutil::WriteTextFile(path, "[1, 2]"));
    auto array = cfg.LoadFile(path);
    EXPECT_FALSE(array.is_ok());
    EXPECT_NE(array.msg.find("root must be JSON object"), std::string::npos);

    auto missing = cfg.LoadFile(tmp.Join("missing.json"));
    EXPECT_FALSE(missing.is_ok());
    EXPECT_NE(missing.msg.find("cannot open"), std::string::npos);
}

TEST(PipelineSettingsTest, MergeFromKeepsUnsetFields) {
    PipelineSettings base;
    base.workspace_dir = "base-ws";
    base.output_archive = "base.7z";
    base.verify_output = true;

    PipelineSettings top;
    top.output_archive = "top.7z";
    top.verify_output = false;

    base.MergeFrom(top);
    EXPECT_EQ(*base.workspace_dir, "base-ws");
    EXPECT_EQ(*base.output_archive, "top.7z");
    EXPECT_FALSE(*base.verify_output);

    base.Reset();
    EXPECT_FALSE(base.workspace_dir.has_value());
}

} // namespace
} // namespace repack::config
