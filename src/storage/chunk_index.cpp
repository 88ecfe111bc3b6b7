#include "storage/chunk_index.hpp"

#include "common/errors.hpp"
#include "storage/csv_table.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <mutex>

namespace segedit {

ChunkIndex::ChunkIndex(std::filesystem::path project_root,
                       std::shared_ptr<spdlog::logger> logger)
    : project_root_(std::move(project_root)),
      metadata_path_(project_root_ / "chunks" / "chunks_metadata.csv"),
      logger_(std::move(logger)) {}

std::vector<Chunk> ChunkIndex::load_chunks(bool force_reload) {
    if (!force_reload) {
        std::shared_lock lock(mutex_);
        if (cache_) {
            return *cache_;
        }
    }

    CsvDocument doc;
    if (auto ec = read_csv_file(metadata_path_, doc)) {
        logger_->error("ChunkIndex: cannot read {}: {}", metadata_path_.string(), ec.message());
        throw Error(Errc::data_unavailable,
                    fmt::format("chunk metadata {} unavailable: {}",
                                metadata_path_.string(), ec.message()));
    }

    std::vector<Chunk> chunks;
    if (auto ec = decode_chunks(doc, chunks)) {
        logger_->error("ChunkIndex: cannot parse {}: {}", metadata_path_.string(), ec.message());
        throw Error(Errc::data_unavailable,
                    fmt::format("chunk metadata {} is malformed", metadata_path_.string()));
    }

    logger_->debug("ChunkIndex: loaded {} chunks from {}", chunks.size(), metadata_path_.string());

    std::unique_lock lock(mutex_);
    cache_ = chunks;
    return chunks;
}

std::vector<Chunk> ChunkIndex::get_all() {
    return load_chunks();
}

std::optional<Chunk> ChunkIndex::get_by_id(int64_t chunk_id) {
    for (auto& chunk : get_all()) {
        if (chunk.chunk_id == chunk_id) {
            return std::move(chunk);
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> ChunkIndex::get_file_path(int64_t chunk_id) {
    auto chunk = get_by_id(chunk_id);
    if (!chunk) {
        return std::nullopt;
    }
    if (chunk->file_path.is_relative()) {
        return project_root_ / chunk->file_path;
    }
    return std::move(chunk->file_path);
}

double ChunkIndex::total_duration() {
    double duration = 0.0;
    for (const auto& chunk : get_all()) {
        duration = std::max(duration, chunk.end_time);
    }
    return duration;
}

} // namespace segedit
