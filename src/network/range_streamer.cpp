#include "network/range_streamer.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace segedit::network {

namespace {

constexpr std::string_view kBytesUnit = "bytes=";

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
    return sv;
}

// Parses an optional decimal bound. Empty → nullopt with success.
bool parse_bound(std::string_view sv, std::optional<std::uint64_t>& out) {
    sv = trim(sv);
    if (sv.empty()) {
        out.reset();
        return true;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

// ── parse_range ───────────────────────────────────────────────────────────────

std::variant<ByteRange, RangeRejection>
parse_range(std::string_view header, std::uint64_t file_size) {
    const auto invalid = [file_size](std::string message) {
        return RangeRejection{Errc::invalid_input, std::move(message), file_size};
    };

    header = trim(header);
    if (header.substr(0, kBytesUnit.size()) != kBytesUnit) {
        return invalid("Invalid Range header");
    }
    auto byte_range = header.substr(kBytesUnit.size());
    if (byte_range.find(',') != std::string_view::npos) {
        return invalid("Multiple ranges are not supported");
    }

    const auto dash = byte_range.find('-');
    if (dash == std::string_view::npos || byte_range.find('-', dash + 1) != std::string_view::npos) {
        return invalid("Invalid Range header");
    }

    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    if (!parse_bound(byte_range.substr(0, dash), first) ||
        !parse_bound(byte_range.substr(dash + 1), last)) {
        return invalid("Invalid Range header");
    }

    const std::uint64_t start = first.value_or(0);
    if (start >= file_size) {
        return RangeRejection{Errc::unsatisfiable_range, "Range not satisfiable", file_size};
    }
    const std::uint64_t end = last.value_or(file_size - 1);
    if (end >= file_size || start > end) {
        return RangeRejection{Errc::unsatisfiable_range, "Range not satisfiable", file_size};
    }
    return ByteRange{start, end};
}

// ── FileChunkReader ──────────────────────────────────────────────────────────

FileChunkReader::FileChunkReader(const std::filesystem::path& path,
                                 std::uint64_t offset,
                                 std::uint64_t length,
                                 std::size_t read_size)
    : in_(path, std::ios::binary),
      remaining_(length),
      buf_(std::max<std::size_t>(read_size, 1)) {
    if (!in_) {
        throw Error(Errc::not_found, fmt::format("Audio file {} could not be opened", path.string()));
    }
    in_.seekg(static_cast<std::streamoff>(offset));
    if (!in_) {
        // Offset past the end of a file that shrank since it was measured.
        remaining_ = 0;
    }
}

std::string_view FileChunkReader::next() {
    if (remaining_ == 0 || !in_.is_open()) {
        return {};
    }
    const auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(remaining_, buf_.size()));
    in_.read(buf_.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in_.gcount());
    if (got == 0) {
        remaining_ = 0;
        return {};
    }
    remaining_ -= got;
    if (got < want) {
        // Source exhausted early: end the body here.
        remaining_ = 0;
    }
    return {buf_.data(), got};
}

void FileChunkReader::close() {
    remaining_ = 0;
    if (in_.is_open()) {
        in_.close();
    }
}

// ── RangeStreamer ────────────────────────────────────────────────────────────

RangeStreamer::RangeStreamer(std::size_t read_size, std::string content_type)
    : read_size_(read_size), content_type_(std::move(content_type)) {}

std::variant<PreparedStream, RangeRejection>
RangeStreamer::prepare(const std::filesystem::path& file,
                       std::optional<std::string_view> range_header) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw Error(Errc::not_found, "Audio file not found");
    }
    const auto file_size = std::filesystem::file_size(file, ec);
    if (ec) {
        // Removed between the two calls.
        throw Error(Errc::not_found, "Audio file not found");
    }

    HttpResponse head;
    head.set_header("Content-Type", content_type_);
    head.set_header("Accept-Ranges", "bytes");

    if (!range_header) {
        head.status = 200;
        return PreparedStream{std::move(head), file_size,
                              FileChunkReader{file, 0, file_size, read_size_}};
    }

    auto parsed = parse_range(*range_header, file_size);
    if (auto* rejection = std::get_if<RangeRejection>(&parsed)) {
        spdlog::debug("RangeStreamer: rejected range '{}' for {} ({} bytes): {}",
                      *range_header, file.string(), file_size, rejection->message);
        return std::move(*rejection);
    }

    const auto range = std::get<ByteRange>(parsed);
    head.status = 206;
    head.set_header("Content-Range",
                    fmt::format("bytes {}-{}/{}", range.start, range.end, file_size));
    head.set_header("Content-Length", std::to_string(range.length()));
    return PreparedStream{std::move(head), range.length(),
                          FileChunkReader{file, range.start, range.length(), read_size_}};
}

boost::asio::awaitable<StreamOutcome>
RangeStreamer::stream(boost::asio::ip::tcp::socket& socket,
                      PreparedStream& prepared,
                      bool keep_alive) const {
    boost::system::error_code ec;
    auto token = boost::asio::redirect_error(boost::asio::use_awaitable, ec);

    const std::string head =
        serialize_response_head(prepared.head, prepared.content_length, keep_alive);
    co_await boost::asio::async_write(socket, boost::asio::buffer(head), token);

    std::uint64_t sent = 0;
    while (!ec) {
        auto piece = prepared.reader.next();
        if (piece.empty()) {
            break;
        }
        co_await boost::asio::async_write(socket, boost::asio::buffer(piece.data(), piece.size()),
                                          token);
        if (!ec) {
            sent += piece.size();
        }
    }
    prepared.reader.close();

    if (ec) {
        spdlog::debug("RangeStreamer: client went away after {} of {} bytes: {}",
                      sent, prepared.content_length, ec.message());
    } else if (sent < prepared.content_length) {
        spdlog::warn("RangeStreamer: source ended early, sent {} of {} bytes",
                     sent, prepared.content_length);
    }
    co_return StreamOutcome{ec, sent};
}

} // namespace segedit::network
