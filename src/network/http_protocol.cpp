#include "network/http_protocol.hpp"

#include <charconv>
#include <fmt/format.h>

namespace segedit::network {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) sv.remove_suffix(1);
    return sv;
}

// Split `line` on the first occurrence of `sep`, returning {head, rest}.
std::pair<std::string_view, std::string_view> split_once(std::string_view line, char sep) {
    const auto pos = line.find(sep);
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_token_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '!' || c == '#' || c == '$' || c == '%' ||
           c == '&' || c == '\'' || c == '*' || c == '+' || c == '.' || c == '^' ||
           c == '`' || c == '|' || c == '~';
}

bool parse_query(std::string_view qs, std::map<std::string, std::string>& out) {
    while (!qs.empty()) {
        auto [pair, rest] = split_once(qs, '&');
        qs = rest;
        if (pair.empty()) continue;

        auto [raw_key, raw_value] = split_once(pair, '=');
        auto key = percent_decode(raw_key, true);
        auto value = percent_decode(raw_value, true);
        if (!key || !value) {
            return false;
        }
        out.insert_or_assign(std::move(*key), std::move(*value));
    }
    return true;
}

} // namespace

std::string to_lower(std::string_view in) {
    std::string out(in);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::optional<std::string> percent_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// ── HttpRequest ───────────────────────────────────────────────────────────────

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view{it->second};
}

std::size_t HttpRequest::content_length() const {
    auto value = header("content-length");
    if (!value) return 0;
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), n);
    if (ec != std::errc{} || ptr != value->data() + value->size()) return 0;
    return n;
}

bool HttpRequest::keep_alive() const {
    if (auto conn = header("connection")) {
        const auto v = to_lower(*conn);
        if (v == "close") return false;
        if (v == "keep-alive") return true;
    }
    return version_minor >= 1;
}

// ── HttpResponse ──────────────────────────────────────────────────────────────

void HttpResponse::set_header(std::string name, std::string value) {
    const auto key = to_lower(name);
    for (auto& [n, v] : headers) {
        if (to_lower(n) == key) {
            v = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::optional<std::string_view> HttpResponse::header(std::string_view name) const {
    const auto key = to_lower(name);
    for (const auto& [n, v] : headers) {
        if (to_lower(n) == key) {
            return std::string_view{v};
        }
    }
    return std::nullopt;
}

// ── parse_request_head ────────────────────────────────────────────────────────

std::variant<HttpRequest, HttpError> parse_request_head(std::string_view head) {
    if (head.size() > kMaxHeadBytes) {
        return HttpError{431, "request head too large"};
    }

    // ── Request line: METHOD SP target SP HTTP/1.x ────────────────────────────
    auto [request_line, rest] = split_once(head, '\n');
    request_line = trim(request_line);
    if (request_line.empty()) {
        return HttpError{400, "empty request line"};
    }

    auto [method, after_method] = split_once(request_line, ' ');
    auto [target, version] = split_once(after_method, ' ');
    if (method.empty() || target.empty() || version.empty()) {
        return HttpError{400, "malformed request line"};
    }
    for (char c : method) {
        if (!is_token_char(c)) {
            return HttpError{400, "malformed method"};
        }
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return HttpError{505, fmt::format("unsupported version '{}'", version)};
    }
    if (target.front() != '/') {
        return HttpError{400, "request target must be an absolute path"};
    }

    HttpRequest req;
    req.method = std::string(method);
    req.target = std::string(target);
    req.version_minor = (version == "HTTP/1.0") ? 0 : 1;

    auto [raw_path, raw_query] = split_once(target, '?');
    auto path = percent_decode(raw_path, false);
    if (!path) {
        return HttpError{400, "malformed percent-encoding in path"};
    }
    req.path = std::move(*path);
    if (!parse_query(raw_query, req.query)) {
        return HttpError{400, "malformed percent-encoding in query"};
    }

    // ── Header fields ─────────────────────────────────────────────────────────
    while (!rest.empty()) {
        auto [line, remaining] = split_once(rest, '\n');
        rest = remaining;
        line = trim(line);
        if (line.empty()) {
            break; // end of head
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return HttpError{400, "malformed header field"};
        }
        auto name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(c)) {
                return HttpError{400, "malformed header name"};
            }
        }
        auto value = trim(line.substr(colon + 1));

        auto key = to_lower(name);
        auto it = req.headers.find(key);
        if (it == req.headers.end()) {
            req.headers.emplace(std::move(key), std::string(value));
        } else {
            it->second += ", ";
            it->second += value;
        }
    }

    if (auto cl = req.header("content-length")) {
        std::size_t n = 0;
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), n);
        if (ec != std::errc{} || ptr != cl->data() + cl->size()) {
            return HttpError{400, "malformed Content-Length"};
        }
        if (n > kMaxBodyBytes) {
            return HttpError{413, "request body too large"};
        }
    }
    if (req.header("transfer-encoding")) {
        return HttpError{501, "chunked request bodies are not supported"};
    }

    return req;
}

// ── Serialisation ─────────────────────────────────────────────────────────────

std::string_view reason_phrase(unsigned status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 416: return "Range Not Satisfiable";
        case 422: return "Unprocessable Entity";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

std::string serialize_response_head(const HttpResponse& response,
                                    std::uint64_t content_length,
                                    bool keep_alive) {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", response.status,
                                  reason_phrase(response.status));
    for (const auto& [name, value] : response.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    if (!response.header("content-length")) {
        out += fmt::format("Content-Length: {}\r\n", content_length);
    }
    if (!response.header("connection")) {
        out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    }
    out += "\r\n";
    return out;
}

std::string serialize_response(const HttpResponse& response, bool keep_alive) {
    std::string out = serialize_response_head(response, response.body.size(), keep_alive);
    out += response.body;
    return out;
}

} // namespace segedit::network
