#include "storage/csv_table.hpp"

#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace segedit {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool needs_quoting(std::string_view cell) {
    return cell.find_first_of(",\"\r\n") != std::string_view::npos;
}

void append_cell(std::string& out, std::string_view cell) {
    if (!needs_quoting(cell)) {
        out.append(cell);
        return;
    }
    out.push_back('"');
    for (char c : cell) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
}

bool is_blank(const std::vector<std::string>& record) {
    return record.size() == 1 && record.front().empty();
}

// Splits `text` into records. Returns false on an unterminated quote.
bool split_records(std::string_view text, std::vector<std::vector<std::string>>& records) {
    std::vector<std::string> record;
    std::string cell;
    bool in_quotes = false;
    bool record_open = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                record_open = true;
                break;
            case ',':
                record.push_back(std::move(cell));
                cell.clear();
                record_open = true;
                break;
            case '\r':
                // Tolerate CRLF; a bare CR inside an unquoted cell is dropped.
                break;
            case '\n':
                record.push_back(std::move(cell));
                cell.clear();
                records.push_back(std::move(record));
                record.clear();
                record_open = false;
                break;
            default:
                cell.push_back(c);
                record_open = true;
                break;
        }
    }

    if (in_quotes) {
        return false;
    }
    if (record_open) {
        record.push_back(std::move(cell));
        records.push_back(std::move(record));
    }
    return true;
}

} // namespace

int CsvDocument::column_index(std::string_view column) const noexcept {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == column) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ── parse_csv ────────────────────────────────────────────────────────────────

std::error_code parse_csv(std::string_view text, CsvDocument& out) {
    out.header.clear();
    out.rows.clear();

    if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        text.remove_prefix(kUtf8Bom.size());
    }

    std::vector<std::vector<std::string>> records;
    if (!split_records(text, records)) {
        spdlog::warn("CSV: unterminated quoted field");
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::size_t line = 0;
    for (auto& record : records) {
        ++line;
        if (is_blank(record)) {
            continue;
        }
        if (out.header.empty()) {
            out.header = std::move(record);
            continue;
        }
        if (record.size() > out.header.size()) {
            spdlog::warn("CSV: record {} has {} fields, header has {}",
                         line, record.size(), out.header.size());
            return std::make_error_code(std::errc::invalid_argument);
        }
        record.resize(out.header.size());
        out.rows.push_back(std::move(record));
    }

    if (out.header.empty()) {
        spdlog::warn("CSV: no header row");
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

// ── read_csv_file ────────────────────────────────────────────────────────────

std::error_code read_csv_file(const std::filesystem::path& path, CsvDocument& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return std::make_error_code(std::errc::io_error);
    }

    std::string text((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        return std::make_error_code(std::errc::io_error);
    }
    return parse_csv(text, out);
}

// ── write_csv ────────────────────────────────────────────────────────────────

std::string write_csv(const CsvDocument& doc) {
    std::string out;
    out.reserve(64 * (doc.rows.size() + 1));

    auto append_record = [&out](const std::vector<std::string>& record) {
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            append_cell(out, record[i]);
        }
        out.push_back('\n');
    };

    append_record(doc.header);
    for (const auto& row : doc.rows) {
        append_record(row);
    }
    return out;
}

} // namespace segedit
