/**
 * @file scratch_dir.h
 * @brief 每次运行独占的临时工作目录
 */

#ifndef JUDGEBOX_SANDBOX_SCRATCH_DIR_H
#define JUDGEBOX_SANDBOX_SCRATCH_DIR_H

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <cstdlib>

#include "core/error.h"

namespace judgebox {
namespace sandbox {

namespace fs = std::filesystem;

/**
 * @brief 临时目录，离开作用域时递归删除
 *
 * 目录名由 mkdtemp 生成，同一个 root 下并发创建互不冲突。
 */
class ScratchDir {
private:
    std::string path_;

public:
    ScratchDir() = default;
    explicit ScratchDir(std::string path) : path_(std::move(path)) {}

    ~ScratchDir() { remove(); }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    ScratchDir(ScratchDir &&other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    ScratchDir& operator=(ScratchDir &&other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    /**
     * @brief 在 root 下创建 <prefix>XXXXXX 目录（root 不存在时一并创建）
     */
    static Result<ScratchDir> create(const std::string &root, const std::string &prefix = "run_") {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) {
            return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                "cannot create scratch root " + root + ": " + ec.message());
        }

        // 沙箱里 chdir 和 Landlock 都需要绝对路径
        fs::path abs_root = fs::absolute(root, ec);
        if (ec) {
            return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                "cannot resolve scratch root " + root + ": " + ec.message());
        }

        std::string tmpl = abs_root.string() + "/" + prefix + "XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            return JUDGEBOX_ERROR(ErrorCode::FILE_WRITE_ERROR,
                "mkdtemp " + tmpl + ": " + strerror(errno));
        }
        return ScratchDir(std::string(buf.data()));
    }

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    std::string file(const std::string &name) const {
        return path_ + "/" + name;
    }

    void remove() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        path_.clear();
    }
};

} // namespace sandbox
} // namespace judgebox

#endif // JUDGEBOX_SANDBOX_SCRATCH_DIR_H
