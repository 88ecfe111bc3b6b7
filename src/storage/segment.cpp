#include "storage/segment.hpp"

#include <charconv>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace segedit {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
    return sv;
}

bool parse_double(std::string_view sv, double& value) {
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return ec == std::errc{} && ptr == sv.data() + sv.size() && std::isfinite(value);
}

// Accepts "42" and the "42.0" form a float-typed column round-trips to.
bool parse_id(std::string_view sv, int64_t& value) {
    sv = trim(sv);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
        return true;
    }
    double d = 0.0;
    if (!parse_double(sv, d) || std::trunc(d) != d) {
        return false;
    }
    // Outside int64 the cast is undefined.
    if (d < -0x1p63 || d >= 0x1p63) {
        return false;
    }
    value = static_cast<int64_t>(d);
    return true;
}

// Empty cells are missing values. "nan"/"NaN" spellings count as missing too.
bool parse_optional_seconds(std::string_view sv, std::optional<double>& value) {
    sv = trim(sv);
    if (sv.empty() || sv == "nan" || sv == "NaN") {
        value.reset();
        return true;
    }
    double d = 0.0;
    if (!parse_double(sv, d)) {
        return false;
    }
    value = d;
    return true;
}

std::optional<std::string> optional_text(const std::string& cell) {
    if (cell.empty()) {
        return std::nullopt;
    }
    return cell;
}

} // namespace

bool SegmentTable::has_column(std::string_view column) const noexcept {
    for (const auto& c : columns) {
        if (c == column) return true;
    }
    return false;
}

std::string format_seconds(double value) {
    std::string out = fmt::format("{}", value);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

// ── decode_segments ──────────────────────────────────────────────────────────

std::error_code decode_segments(const CsvDocument& doc, SegmentTable& out) {
    const int id_col    = doc.column_index(columns::kSegmentId);
    const int chunk_col = doc.column_index(columns::kChunkId);
    const int start_col = doc.column_index(columns::kStartSec);
    const int end_col   = doc.column_index(columns::kEndSec);
    const int text_col  = doc.column_index(columns::kText);
    const int lang_col  = doc.column_index(columns::kLanguage);
    const int gap_col   = doc.column_index(columns::kGapType);
    const int spk_col   = doc.column_index(columns::kSpeaker);

    if (id_col < 0 || chunk_col < 0 || start_col < 0 || end_col < 0 || text_col < 0) {
        spdlog::warn("Segments: header is missing a required column "
                     "(segment_id, chunk_id, start_sec, end_sec, text)");
        return std::make_error_code(std::errc::invalid_argument);
    }

    out.columns = doc.header;
    out.rows.clear();
    out.rows.reserve(doc.rows.size());

    for (std::size_t r = 0; r < doc.rows.size(); ++r) {
        const auto& row = doc.rows[r];
        Segment seg;

        if (!parse_id(row[id_col], seg.segment_id) ||
            !parse_id(row[chunk_col], seg.chunk_id)) {
            spdlog::warn("Segments: row {} has a malformed segment_id/chunk_id", r + 1);
            return std::make_error_code(std::errc::invalid_argument);
        }
        if (!parse_optional_seconds(row[start_col], seg.start_sec) ||
            !parse_optional_seconds(row[end_col], seg.end_sec)) {
            spdlog::warn("Segments: row {} (segment {}) has malformed times",
                         r + 1, seg.segment_id);
            return std::make_error_code(std::errc::invalid_argument);
        }
        seg.text = row[text_col];
        if (lang_col >= 0) seg.language = optional_text(row[lang_col]);
        if (gap_col >= 0)  seg.gap_type = optional_text(row[gap_col]);
        if (spk_col >= 0)  seg.speaker  = optional_text(row[spk_col]);

        for (std::size_t c = 0; c < doc.header.size(); ++c) {
            const int ci = static_cast<int>(c);
            if (ci == id_col || ci == chunk_col || ci == start_col || ci == end_col ||
                ci == text_col || ci == lang_col || ci == gap_col || ci == spk_col) {
                continue;
            }
            seg.extra.emplace_back(doc.header[c], row[c]);
        }

        out.rows.push_back(std::move(seg));
    }
    return {};
}

// ── encode_segments ──────────────────────────────────────────────────────────

CsvDocument encode_segments(const SegmentTable& table) {
    CsvDocument doc;
    doc.header = table.columns;
    doc.rows.reserve(table.rows.size());

    for (const auto& seg : table.rows) {
        std::vector<std::string> row;
        row.reserve(table.columns.size());

        for (const auto& column : table.columns) {
            if (column == columns::kSegmentId) {
                row.push_back(std::to_string(seg.segment_id));
            } else if (column == columns::kChunkId) {
                row.push_back(std::to_string(seg.chunk_id));
            } else if (column == columns::kStartSec) {
                row.push_back(seg.start_sec ? format_seconds(*seg.start_sec) : std::string{});
            } else if (column == columns::kEndSec) {
                row.push_back(seg.end_sec ? format_seconds(*seg.end_sec) : std::string{});
            } else if (column == columns::kText) {
                row.push_back(seg.text);
            } else if (column == columns::kLanguage) {
                row.push_back(seg.language.value_or(""));
            } else if (column == columns::kGapType) {
                row.push_back(seg.gap_type.value_or(""));
            } else if (column == columns::kSpeaker) {
                row.push_back(seg.speaker.value_or(""));
            } else {
                std::string cell;
                for (const auto& [name, value] : seg.extra) {
                    if (name == column) {
                        cell = value;
                        break;
                    }
                }
                row.push_back(std::move(cell));
            }
        }
        doc.rows.push_back(std::move(row));
    }
    return doc;
}

// ── decode_chunks ────────────────────────────────────────────────────────────

std::error_code decode_chunks(const CsvDocument& doc, std::vector<Chunk>& out) {
    const int id_col    = doc.column_index(columns::kChunkIdLabel);
    const int path_col  = doc.column_index(columns::kFilePathLabel);
    const int start_col = doc.column_index(columns::kStartTimeLabel);
    const int end_col   = doc.column_index(columns::kEndTimeLabel);

    if (id_col < 0 || path_col < 0 || start_col < 0 || end_col < 0) {
        spdlog::warn("Chunks: header is missing a required column "
                     "(Chunk ID, File Path, Start Time (s), End Time (s))");
        return std::make_error_code(std::errc::invalid_argument);
    }

    out.clear();
    out.reserve(doc.rows.size());

    for (std::size_t r = 0; r < doc.rows.size(); ++r) {
        const auto& row = doc.rows[r];
        Chunk chunk;
        if (!parse_id(row[id_col], chunk.chunk_id) ||
            !parse_double(row[start_col], chunk.start_time) ||
            !parse_double(row[end_col], chunk.end_time) ||
            trim(row[path_col]).empty()) {
            spdlog::warn("Chunks: row {} is malformed", r + 1);
            return std::make_error_code(std::errc::invalid_argument);
        }
        chunk.file_path = std::string(trim(row[path_col]));
        out.push_back(std::move(chunk));
    }
    return {};
}

// ── apply_update ─────────────────────────────────────────────────────────────

void apply_update(const SegmentTable& table, const SegmentUpdate& update, Segment& segment) {
    if (update.start_sec && table.has_column(columns::kStartSec)) {
        segment.start_sec = *update.start_sec;
    }
    if (update.end_sec && table.has_column(columns::kEndSec)) {
        segment.end_sec = *update.end_sec;
    }
    if (update.text && table.has_column(columns::kText)) {
        segment.text = *update.text;
    }
}

} // namespace segedit
