#pragma once

#include "storage/csv_table.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace segedit {

// ── Segment ───────────────────────────────────────────────────────────────────
//
// One transcript utterance. Missing numeric cells are nullopt, never NaN.
// language / gap_type / speaker are nullopt when the column is absent from
// the schema or the cell is empty.

struct Segment {
    int64_t segment_id = 0;
    int64_t chunk_id   = 0;
    std::optional<double> start_sec;
    std::optional<double> end_sec;
    std::string text;
    std::optional<std::string> language;
    std::optional<std::string> gap_type;
    std::optional<std::string> speaker;

    // Columns the store does not interpret, as {column, raw cell}, kept so a
    // rewrite preserves them verbatim.
    std::vector<std::pair<std::string, std::string>> extra;
};

// ── SegmentUpdate ────────────────────────────────────────────────────────────
//
// The only fields mutable through the store. Unset fields are left alone.

struct SegmentUpdate {
    std::optional<double> start_sec;
    std::optional<double> end_sec;
    std::optional<std::string> text;

    [[nodiscard]] bool empty() const noexcept {
        return !start_sec && !end_sec && !text;
    }
};

// ── SegmentTable ─────────────────────────────────────────────────────────────
//
// Rows in file order plus the column layout they were read with.

struct SegmentTable {
    std::vector<std::string> columns;
    std::vector<Segment> rows;

    [[nodiscard]] bool has_column(std::string_view column) const noexcept;
};

// ── Chunk ─────────────────────────────────────────────────────────────────────

struct Chunk {
    int64_t chunk_id = 0;
    std::filesystem::path file_path;
    double start_time = 0.0;
    double end_time   = 0.0;
};

// ── Column names ──────────────────────────────────────────────────────────────

namespace columns {
inline constexpr std::string_view kSegmentId = "segment_id";
inline constexpr std::string_view kChunkId   = "chunk_id";
inline constexpr std::string_view kStartSec  = "start_sec";
inline constexpr std::string_view kEndSec    = "end_sec";
inline constexpr std::string_view kText      = "text";
inline constexpr std::string_view kLanguage  = "language";
inline constexpr std::string_view kGapType   = "gap_type";
inline constexpr std::string_view kSpeaker   = "speaker";

// Human-readable headers of chunks_metadata.csv.
inline constexpr std::string_view kChunkIdLabel   = "Chunk ID";
inline constexpr std::string_view kFilePathLabel  = "File Path";
inline constexpr std::string_view kStartTimeLabel = "Start Time (s)";
inline constexpr std::string_view kEndTimeLabel   = "End Time (s)";
} // namespace columns

// ── Codec ─────────────────────────────────────────────────────────────────────
//
// decode_* return std::errc::invalid_argument when a required column is
// missing or a required cell does not parse; `out` is unspecified then.

[[nodiscard]] std::error_code decode_segments(const CsvDocument& doc, SegmentTable& out);

[[nodiscard]] CsvDocument encode_segments(const SegmentTable& table);

// Maps the human-readable chunk headers onto Chunk fields.
[[nodiscard]] std::error_code decode_chunks(const CsvDocument& doc, std::vector<Chunk>& out);

// Applies the set fields of `update` that exist as columns of `table`.
void apply_update(const SegmentTable& table, const SegmentUpdate& update, Segment& segment);

// Shortest decimal text that round-trips, always carrying a fractional part
// or exponent ("12.0", "0.25", "1e-07").
[[nodiscard]] std::string format_seconds(double value);

} // namespace segedit
