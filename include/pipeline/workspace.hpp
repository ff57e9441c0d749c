#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace repack {

// What Acquire does when the workspace path already exists.
enum class StalePolicy {
    Fail,
    ForceClean,
};

// Scoped owner of the extraction directory. Acquire creates it, Release (or
// the destructor, as a fallback) removes it recursively exactly once.
class Workspace {
  public:
    class IFileSystemOps {
      public:
        virtual ~IFileSystemOps() = default;
        virtual Result Exists(std::string_view path, bool& out_exists) const = 0;
        virtual Result CreateDirectory(std::string_view path) const = 0;
        virtual Result RemoveAll(std::string_view path) const = 0;
    };

    Workspace();
    explicit Workspace(std::shared_ptr<const IFileSystemOps> fs_ops);
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    ~Workspace();

    static Result Acquire(std::string_view path, StalePolicy policy, Workspace& out);

    Result Release();
    const std::string& Dir() const { return dir_; }
    bool Active() const { return active_; }

  private:
    void Cleanup();

    static std::shared_ptr<const IFileSystemOps> DefaultFileSystemOps();

    std::shared_ptr<const IFileSystemOps> fs_ops_;
    std::string dir_;
    bool active_ = false;
};

} // namespace repack
