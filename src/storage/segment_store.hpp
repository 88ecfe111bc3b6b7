#pragma once

#include "common/clock.hpp"
#include "persistence/backup_writer.hpp"
#include "storage/segment.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace segedit {

// ── SegmentStore ─────────────────────────────────────────────────────────────
//
// In-memory segment table of one project, backed by
// <project_root>/transcriptions/segments.csv.
//
// Reads are served from a cache filled on first use. Every mutation reloads
// the file first, applies the change, backs up the current file, atomically
// replaces it and only then swaps the new table into the cache, so after a
// successful mutation the cache equals the file.
//
// Concurrency model:
//   - reload → mutate → persist runs under write_mutex_, so concurrent
//     update()/remove() calls on one store apply in some serial order.
//   - the cache is guarded by a shared_mutex; readers never observe a table
//     that is not also a complete file state.
//
// Load failures raise segedit::Error(Errc::data_unavailable) and leave the
// cache untouched. Persistence failures raise Errc::io_failure.

class SegmentStore {
public:
    SegmentStore(std::filesystem::path project_root,
                 const Clock& clock,
                 std::shared_ptr<spdlog::logger> logger);

    SegmentStore(const SegmentStore&)            = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    // Cached table, re-parsed from disk if never loaded or `force_reload`.
    [[nodiscard]] SegmentTable load_segments(bool force_reload = false);

    // Segments with chunk_id == `chunk_id`, in file order.
    [[nodiscard]] std::vector<Segment> get_by_chunk(int64_t chunk_id);

    // First segment with `segment_id`, or nullopt.
    [[nodiscard]] std::optional<Segment> get_by_id(int64_t segment_id);

    // The whole table in file order.
    [[nodiscard]] std::vector<Segment> get_all();

    // Applies `update` to the segment and persists. Returns the updated row,
    // or nullopt if no such segment exists (nothing is written then).
    // Throws Errc::invalid_input if `update` sets no field.
    [[nodiscard]] std::optional<Segment> update(int64_t segment_id, const SegmentUpdate& update);

    // Removes the segment and persists. Returns false if it does not exist.
    bool remove(int64_t segment_id);

    [[nodiscard]] const std::filesystem::path& segments_path() const noexcept { return segments_path_; }
    [[nodiscard]] const std::filesystem::path& backup_dir() const noexcept { return backup_.backup_dir(); }

private:
    // Parses the backing file. Throws Errc::data_unavailable.
    [[nodiscard]] SegmentTable read_from_disk() const;

    // Backup, then atomic replace. Throws Errc::io_failure.
    void persist(const SegmentTable& table);

    void store_cache(SegmentTable table);

    std::filesystem::path segments_path_;
    persistence::BackupWriter backup_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex write_mutex_;
    mutable std::shared_mutex cache_mutex_;
    std::optional<SegmentTable> cache_;
};

} // namespace segedit
