#pragma once

#include "common/clock.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace segedit::persistence {

// ── BackupWriter ─────────────────────────────────────────────────────────────
//
// Copies the current bytes of a file into
//
//   <backup_dir>/<stem>_<YYYYMMDD_HHMMSS><ext>
//
// before it gets overwritten. The timestamp is local time with second
// resolution; two backups within the same second share a name and the later
// one wins. Backups are never pruned.

class BackupWriter {
public:
    BackupWriter(std::filesystem::path backup_dir, const Clock& clock);

    // Copy `source` into the backup directory (created on demand).
    // If `source` does not exist there is nothing to preserve: returns success
    // and leaves `written` empty. Otherwise `written` receives the backup path.
    [[nodiscard]] std::error_code backup(const std::filesystem::path& source,
                                         std::optional<std::filesystem::path>& written) const;

    // Name the backup of `source` would get at time `tp`.
    [[nodiscard]] std::filesystem::path backup_path_for(const std::filesystem::path& source,
                                                        Clock::time_point tp) const;

    [[nodiscard]] const std::filesystem::path& backup_dir() const noexcept { return backup_dir_; }

private:
    std::filesystem::path backup_dir_;
    const Clock& clock_;
};

// Formats `tp` as YYYYMMDD_HHMMSS in local time.
[[nodiscard]] std::string format_backup_timestamp(Clock::time_point tp);

} // namespace segedit::persistence
