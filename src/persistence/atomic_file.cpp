#include "persistence/atomic_file.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace segedit::persistence {

namespace {

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Best-effort cleanup of a temp file left behind by a failed replace.
void discard(const std::filesystem::path& tmp_path) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
}

} // namespace

std::filesystem::path AtomicFile::temp_path_for(const std::filesystem::path& path) {
    auto tmp_path = path;
    tmp_path += ".tmp";
    return tmp_path;
}

// ── AtomicFile::replace ──────────────────────────────────────────────────────

std::error_code AtomicFile::replace(const std::filesystem::path& path,
                                    std::string_view content) {
    const auto tmp_path = temp_path_for(path);

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("AtomicFile: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, content.data(), content.size());
    if (ec) {
        spdlog::error("AtomicFile: write to {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        discard(tmp_path);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("AtomicFile: fsync of {} failed: {}", tmp_path.string(), ec.message());
        ::close(fd);
        discard(tmp_path);
        return ec;
    }

    if (::close(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("AtomicFile: close of {} failed: {}", tmp_path.string(), ec.message());
        discard(tmp_path);
        return ec;
    }

    // Rename .tmp → final path.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("AtomicFile: rename {} -> {} failed: {}",
                      tmp_path.string(), path.string(), rename_ec.message());
        discard(tmp_path);
        return rename_ec;
    }

    spdlog::debug("AtomicFile: replaced {} ({} bytes)", path.string(), content.size());
    return {};
}

} // namespace segedit::persistence
