#pragma once

#include "common/errors.hpp"
#include "network/http_protocol.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace segedit::network {

// ── Byte ranges ───────────────────────────────────────────────────────────────

// Inclusive byte interval [start, end] of a file.
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end   = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

// A Range header that cannot be served.
//   code == Errc::invalid_input       – syntax error
//   code == Errc::unsatisfiable_range – outside [0, file_size)
// Both are answered with 416; the latter carries Content-Range: bytes */size.
struct RangeRejection {
    Errc code = Errc::invalid_input;
    std::string message;
    std::uint64_t file_size = 0;
};

// Resolve a single-range header value "bytes=<start>-<end>" against a file of
// `file_size` bytes. A missing start means 0, a missing end means the last
// byte. Multiple ranges are rejected as invalid.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<ByteRange, RangeRejection>
parse_range(std::string_view header, std::uint64_t file_size);

// ── FileChunkReader ──────────────────────────────────────────────────────────
//
// Reads `length` bytes starting at `offset` in slices of at most `read_size`
// bytes. Only one slice is held in memory. If the file turns out shorter than
// expected the reader simply ends early; nothing is padded.

class FileChunkReader {
public:
    // Throws Error(Errc::not_found) if the file cannot be opened.
    FileChunkReader(const std::filesystem::path& path,
                    std::uint64_t offset,
                    std::uint64_t length,
                    std::size_t read_size);

    // Next slice, or an empty view once `length` bytes were produced or the
    // file ended. The view is valid until the next call.
    [[nodiscard]] std::string_view next();

    [[nodiscard]] std::uint64_t remaining() const noexcept { return remaining_; }

    // Releases the file handle; further next() calls return empty views.
    void close();

private:
    std::ifstream in_;
    std::uint64_t remaining_;
    std::vector<char> buf_;
};

// ── PreparedStream ───────────────────────────────────────────────────────────
//
// Everything needed to answer an audio request: the status and headers
// (200 or 206), the body length and an open reader positioned at the first
// byte.

struct PreparedStream {
    HttpResponse head;
    std::uint64_t content_length = 0;
    FileChunkReader reader;
};

struct StreamOutcome {
    boost::system::error_code error;   // first write error, if any
    std::uint64_t bytes_sent = 0;      // body bytes written

    // The connection can carry another request only if the promised body
    // went out in full.
    [[nodiscard]] bool complete(const PreparedStream& s) const noexcept {
        return !error && bytes_sent == s.content_length;
    }
};

// ── RangeStreamer ────────────────────────────────────────────────────────────
//
// Serves a local media file with HTTP single-range semantics:
//
//   no Range              → 200, Accept-Ranges: bytes, full file
//   satisfiable Range     → 206, Content-Range: bytes s-e/size,
//                           Content-Length: e-s+1
//   invalid/unsatisfiable → RangeRejection (416)
//
// The body is streamed in bounded slices; a client disconnect ends the loop
// and closes the file.

class RangeStreamer {
public:
    static constexpr std::size_t kDefaultReadSize = 8192;
    static constexpr const char* kDefaultContentType = "video/mp4";

    explicit RangeStreamer(std::size_t read_size = kDefaultReadSize,
                           std::string content_type = kDefaultContentType);

    // Stats and opens `file`. Throws Error(Errc::not_found) if the file does
    // not exist, is not a regular file or vanished before it could be opened.
    [[nodiscard]] std::variant<PreparedStream, RangeRejection>
    prepare(const std::filesystem::path& file,
            std::optional<std::string_view> range_header) const;

    // Writes head and body of `stream` to `socket`. The reader is closed on
    // return. A write error (e.g. client disconnect) stops the loop.
    boost::asio::awaitable<StreamOutcome>
    stream(boost::asio::ip::tcp::socket& socket, PreparedStream& stream, bool keep_alive) const;

    [[nodiscard]] std::size_t read_size() const noexcept { return read_size_; }

private:
    std::size_t read_size_;
    std::string content_type_;
};

} // namespace segedit::network
