#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace segedit::network {

// ── Requests ──────────────────────────────────────────────────────────────────
//
// Parsed HTTP/1.x request head plus body. Header names are lower-cased; the
// path is percent-decoded and split from the query string.

struct HttpRequest {
    std::string method;
    std::string target;        // raw request-target as received
    std::string path;          // decoded path, no query
    std::map<std::string, std::string> query;
    int version_minor = 1;     // HTTP/1.<minor>
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    // Content-Length value, 0 if absent.
    [[nodiscard]] std::size_t content_length() const;

    // HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close; Connection overrides.
    [[nodiscard]] bool keep_alive() const;
};

// ── Responses ─────────────────────────────────────────────────────────────────

struct HttpResponse {
    unsigned status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Replaces an existing header of the same name (case-insensitive).
    void set_header(std::string name, std::string value);

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

// A request that could not be parsed: answer with `status` and close.
struct HttpError {
    unsigned status = 400;
    std::string message;
};

// ── Protocol ──────────────────────────────────────────────────────────────────

// Upper bound on the request head; larger heads are answered with 431.
inline constexpr std::size_t kMaxHeadBytes = 16 * 1024;

// Upper bound on request bodies; larger bodies are answered with 413.
inline constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

// Parse a request head (request line + headers, with or without the final
// blank line). Body is not touched.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<HttpRequest, HttpError> parse_request_head(std::string_view head);

// Serialise status line + headers + blank line. Adds Content-Length
// (`content_length`) and Connection unless already present.
[[nodiscard]] std::string serialize_response_head(const HttpResponse& response,
                                                  std::uint64_t content_length,
                                                  bool keep_alive);

// Head followed by response.body.
[[nodiscard]] std::string serialize_response(const HttpResponse& response, bool keep_alive);

[[nodiscard]] std::string_view reason_phrase(unsigned status) noexcept;

// Decodes %XX escapes (and '+' as space when `plus_as_space`).
// Returns nullopt on a malformed escape.
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space);

// Lower-cases ASCII letters.
[[nodiscard]] std::string to_lower(std::string_view in);

} // namespace segedit::network
