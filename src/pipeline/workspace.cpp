#include "pipeline/workspace.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace repack {

namespace {

class PosixFileSystemOps final : public Workspace::IFileSystemOps {
  public:
    Result Exists(std::string_view path, bool& out_exists) const override {
        std::error_code ec;
        const auto st = fs::symlink_status(fs::path(path), ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Result::Fail(ec.value(), "stat " + std::string(path) + " failed: " + ec.message());
        }
        out_exists = !ec && fs::exists(st);
        return Result::Ok();
    }

    Result CreateDirectory(std::string_view path) const override {
        std::error_code ec;
        fs::create_directories(fs::path(path), ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot create " + std::string(path) + ": " + ec.message());
        }
        if (!fs::is_directory(fs::path(path), ec)) {
            return Result::Fail(-1, std::string(path) + " is not a directory");
        }
        return Result::Ok();
    }

    Result RemoveAll(std::string_view path) const override {
        std::error_code ec;
        fs::remove_all(fs::path(path), ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot remove " + std::string(path) + ": " + ec.message());
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const Workspace::IFileSystemOps> Workspace::DefaultFileSystemOps() {
    static const std::shared_ptr<const IFileSystemOps> kDefault =
        std::make_shared<PosixFileSystemOps>();
    return kDefault;
}

Workspace::Workspace() : fs_ops_(DefaultFileSystemOps()) {}

Workspace::Workspace(std::shared_ptr<const IFileSystemOps> fs_ops)
    : fs_ops_(fs_ops ? std::move(fs_ops) : DefaultFileSystemOps()) {}

Workspace::Workspace(Workspace&& other) noexcept
    : fs_ops_(std::move(other.fs_ops_)), dir_(std::move(other.dir_)), active_(other.active_) {
    other.active_ = false;
    other.dir_.clear();
    other.fs_ops_ = DefaultFileSystemOps();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    fs_ops_ = std::move(other.fs_ops_);
    dir_ = std::move(other.dir_);
    active_ = other.active_;
    other.active_ = false;
    other.dir_.clear();
    other.fs_ops_ = DefaultFileSystemOps();
    return *this;
}

Workspace::~Workspace() { Cleanup(); }

Result Workspace::Acquire(std::string_view path, StalePolicy policy, Workspace& out) {
    out.Cleanup();
    out.dir_.clear();

    if (path.empty())
        return Result::Fail(-1, "workspace path is empty");

    bool exists = false;
    auto exists_result = out.fs_ops_->Exists(path, exists);
    if (!exists_result.is_ok())
        return exists_result;

    if (exists) {
        if (policy == StalePolicy::Fail) {
            return Result::Fail(-1,
                                "workspace " + std::string(path) +
                                    " already exists (left over from an earlier run?); "
                                    "remove it or use --force-clean");
        }
        LogWarn("Workspace %.*s already exists, clearing it",
                static_cast<int>(path.size()), path.data());
        auto clear_result = out.fs_ops_->RemoveAll(path);
        if (!clear_result.is_ok())
            return clear_result.WithContext("cannot clear stale workspace");
    }

    auto create_result = out.fs_ops_->CreateDirectory(path);
    if (!create_result.is_ok())
        return create_result;

    out.dir_ = std::string(path);
    out.active_ = true;
    LogDebug("Workspace acquired: %s", out.dir_.c_str());
    return Result::Ok();
}

Result Workspace::Release() {
    if (!active_)
        return Result::Ok();

    // Released exactly once, even when removal fails.
    active_ = false;
    auto remove_result = fs_ops_->RemoveAll(dir_);
    if (!remove_result.is_ok())
        return remove_result;

    LogDebug("Workspace released: %s", dir_.c_str());
    return Result::Ok();
}

void Workspace::Cleanup() {
    if (!active_)
        return;
    auto res = Release();
    if (!res.is_ok()) {
        LogError("Workspace cleanup failed: %s", res.message().c_str());
    }
}

} // namespace repack
