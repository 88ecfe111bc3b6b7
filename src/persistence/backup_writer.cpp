#include "persistence/backup_writer.hpp"

#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace segedit::persistence {

std::string format_backup_timestamp(Clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(t));
}

BackupWriter::BackupWriter(std::filesystem::path backup_dir, const Clock& clock)
    : backup_dir_(std::move(backup_dir)), clock_(clock) {}

std::filesystem::path BackupWriter::backup_path_for(const std::filesystem::path& source,
                                                    Clock::time_point tp) const {
    const auto name = fmt::format("{}_{}{}",
                                  source.stem().string(),
                                  format_backup_timestamp(tp),
                                  source.extension().string());
    return backup_dir_ / name;
}

std::error_code BackupWriter::backup(const std::filesystem::path& source,
                                     std::optional<std::filesystem::path>& written) const {
    written.reset();

    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        if (ec) {
            spdlog::error("BackupWriter: cannot stat {}: {}", source.string(), ec.message());
            return ec;
        }
        spdlog::debug("BackupWriter: {} does not exist, nothing to back up", source.string());
        return {};
    }

    std::filesystem::create_directories(backup_dir_, ec);
    if (ec) {
        spdlog::error("BackupWriter: failed to create {}: {}",
                      backup_dir_.string(), ec.message());
        return ec;
    }

    auto target = backup_path_for(source, clock_.now());
    std::filesystem::copy_file(source, target,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("BackupWriter: copy {} -> {} failed: {}",
                      source.string(), target.string(), ec.message());
        return ec;
    }

    spdlog::debug("BackupWriter: backed up {} to {}", source.string(), target.string());
    written = std::move(target);
    return {};
}

} // namespace segedit::persistence
