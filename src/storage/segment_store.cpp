#include "storage/segment_store.hpp"

#include "common/errors.hpp"
#include "persistence/atomic_file.hpp"
#include "storage/csv_table.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace segedit {

SegmentStore::SegmentStore(std::filesystem::path project_root,
                           const Clock& clock,
                           std::shared_ptr<spdlog::logger> logger)
    : segments_path_(project_root / "transcriptions" / "segments.csv"),
      backup_(project_root / "transcriptions" / "backups", clock),
      logger_(std::move(logger)) {}

// ── Loading ──────────────────────────────────────────────────────────────────

SegmentTable SegmentStore::read_from_disk() const {
    CsvDocument doc;
    if (auto ec = read_csv_file(segments_path_, doc)) {
        logger_->error("SegmentStore: cannot read {}: {}", segments_path_.string(), ec.message());
        throw Error(Errc::data_unavailable,
                    fmt::format("segments file {} unavailable: {}",
                                segments_path_.string(), ec.message()));
    }

    SegmentTable table;
    if (auto ec = decode_segments(doc, table)) {
        logger_->error("SegmentStore: cannot parse {}: {}", segments_path_.string(), ec.message());
        throw Error(Errc::data_unavailable,
                    fmt::format("segments file {} is malformed", segments_path_.string()));
    }

    logger_->debug("SegmentStore: loaded {} segments from {}",
                   table.rows.size(), segments_path_.string());
    return table;
}

void SegmentStore::store_cache(SegmentTable table) {
    std::unique_lock lock(cache_mutex_);
    cache_ = std::move(table);
}

SegmentTable SegmentStore::load_segments(bool force_reload) {
    if (!force_reload) {
        std::shared_lock lock(cache_mutex_);
        if (cache_) {
            return *cache_;
        }
    }

    auto table = read_from_disk();
    store_cache(table);
    return table;
}

// ── Queries ──────────────────────────────────────────────────────────────────

std::vector<Segment> SegmentStore::get_by_chunk(int64_t chunk_id) {
    auto table = load_segments();
    std::vector<Segment> result;
    std::copy_if(table.rows.begin(), table.rows.end(), std::back_inserter(result),
                 [chunk_id](const Segment& s) { return s.chunk_id == chunk_id; });
    return result;
}

std::optional<Segment> SegmentStore::get_by_id(int64_t segment_id) {
    auto table = load_segments();
    auto it = std::find_if(table.rows.begin(), table.rows.end(),
                           [segment_id](const Segment& s) { return s.segment_id == segment_id; });
    if (it == table.rows.end()) {
        return std::nullopt;
    }
    return std::move(*it);
}

std::vector<Segment> SegmentStore::get_all() {
    return load_segments().rows;
}

// ── Mutations ────────────────────────────────────────────────────────────────

std::optional<Segment> SegmentStore::update(int64_t segment_id, const SegmentUpdate& update) {
    if (update.empty()) {
        throw Error(Errc::invalid_input, "No valid updates provided");
    }

    std::lock_guard write_lock(write_mutex_);

    // The file may have been changed by another process since the last load.
    auto table = read_from_disk();
    store_cache(table);

    auto it = std::find_if(table.rows.begin(), table.rows.end(),
                           [segment_id](const Segment& s) { return s.segment_id == segment_id; });
    if (it == table.rows.end()) {
        logger_->debug("SegmentStore: update of unknown segment {}", segment_id);
        return std::nullopt;
    }

    apply_update(table, update, *it);
    Segment updated = *it;

    persist(table);
    store_cache(std::move(table));

    logger_->info("SegmentStore: updated segment {}", segment_id);
    return updated;
}

bool SegmentStore::remove(int64_t segment_id) {
    std::lock_guard write_lock(write_mutex_);

    auto table = read_from_disk();
    store_cache(table);

    auto it = std::find_if(table.rows.begin(), table.rows.end(),
                           [segment_id](const Segment& s) { return s.segment_id == segment_id; });
    if (it == table.rows.end()) {
        logger_->debug("SegmentStore: delete of unknown segment {}", segment_id);
        return false;
    }

    table.rows.erase(it);

    persist(table);
    store_cache(std::move(table));

    logger_->info("SegmentStore: deleted segment {}", segment_id);
    return true;
}

// ── Persistence ──────────────────────────────────────────────────────────────

void SegmentStore::persist(const SegmentTable& table) {
    std::optional<std::filesystem::path> backup_path;
    if (auto ec = backup_.backup(segments_path_, backup_path)) {
        throw Error(Errc::io_failure,
                    fmt::format("backup of {} failed: {}", segments_path_.string(), ec.message()));
    }
    if (backup_path) {
        logger_->debug("SegmentStore: backup written to {}", backup_path->string());
    }

    const auto content = write_csv(encode_segments(table));
    if (auto ec = persistence::AtomicFile::replace(segments_path_, content)) {
        throw Error(Errc::io_failure,
                    fmt::format("write of {} failed: {}", segments_path_.string(), ec.message()));
    }
}

} // namespace segedit
