#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace segedit {

// ── CsvDocument ──────────────────────────────────────────────────────────────
//
// A header row plus data rows, all cells kept as raw (unquoted) strings.
// Every row has exactly header.size() cells after a successful parse.

struct CsvDocument {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // Index of `column` in the header, or -1 if absent.
    [[nodiscard]] int column_index(std::string_view column) const noexcept;
};

// ── CSV reader / writer ──────────────────────────────────────────────────────
//
// RFC 4180 dialect as written by the upstream pipeline:
//   - ',' separator, '"' quoting, '""' escapes a quote inside a quoted field
//   - quoted fields may span lines
//   - LF or CRLF line endings; blank lines are skipped; a leading UTF-8 BOM
//     is ignored
//   - a row shorter than the header is padded with empty cells; a longer row
//     or an unterminated quote is a parse error (std::errc::invalid_argument)
//
// Thread-safety: pure functions, no shared state.

[[nodiscard]] std::error_code parse_csv(std::string_view text, CsvDocument& out);

// Reads and parses `path`. A missing file yields
// std::errc::no_such_file_or_directory.
[[nodiscard]] std::error_code read_csv_file(const std::filesystem::path& path,
                                            CsvDocument& out);

// Serialises `doc` with '\n' line endings. Cells containing a separator,
// quote, CR or LF are quoted.
[[nodiscard]] std::string write_csv(const CsvDocument& doc);

} // namespace segedit
