#pragma once

#include "storage/segment.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace segedit {

// ── ChunkIndex ───────────────────────────────────────────────────────────────
//
// Read-only view of <project_root>/chunks/chunks_metadata.csv with the
// human-readable headers normalised to Chunk fields. Chunks keep file_path as
// written in the metadata; get_file_path() resolves relative paths against
// the project root.
//
// Lookups are linear scans; projects have tens to low hundreds of chunks.
// Load failures raise segedit::Error(Errc::data_unavailable).

class ChunkIndex {
public:
    ChunkIndex(std::filesystem::path project_root, std::shared_ptr<spdlog::logger> logger);

    ChunkIndex(const ChunkIndex&)            = delete;
    ChunkIndex& operator=(const ChunkIndex&) = delete;

    [[nodiscard]] std::vector<Chunk> load_chunks(bool force_reload = false);

    [[nodiscard]] std::vector<Chunk> get_all();

    [[nodiscard]] std::optional<Chunk> get_by_id(int64_t chunk_id);

    [[nodiscard]] std::optional<std::filesystem::path> get_file_path(int64_t chunk_id);

    // Largest end_time across all chunks; 0 for an empty index.
    [[nodiscard]] double total_duration();

    [[nodiscard]] const std::filesystem::path& metadata_path() const noexcept { return metadata_path_; }

private:
    std::filesystem::path project_root_;
    std::filesystem::path metadata_path_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex mutex_;
    std::optional<std::vector<Chunk>> cache_;
};

} // namespace segedit
