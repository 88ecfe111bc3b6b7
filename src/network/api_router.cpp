#include "network/api_router.hpp"

#include "common/errors.hpp"
#include "network/json_codec.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>

namespace segedit::network {

namespace {

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    while (!path.empty()) {
        const auto slash = path.find('/');
        auto part = path.substr(0, slash);
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return parts;
}

std::optional<int64_t> parse_int(std::string_view sv) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return value;
}

int64_t require_id(std::string_view sv, std::string_view what) {
    auto id = parse_int(sv);
    if (!id) {
        throw Error(Errc::invalid_input, fmt::format("{} must be an integer", what));
    }
    return *id;
}

HttpResponse method_not_allowed(std::string_view allow) {
    auto resp = error_response(405, "Method Not Allowed");
    resp.set_header("Allow", std::string(allow));
    return resp;
}

HttpResponse range_not_satisfiable(const RangeRejection& rejection) {
    auto resp = error_response(416, rejection.message);
    if (rejection.code == Errc::unsatisfiable_range) {
        resp.set_header("Content-Range", fmt::format("bytes */{}", rejection.file_size));
    }
    return resp;
}

} // namespace

unsigned status_for(const std::error_code& ec) noexcept {
    if (ec.category() != error_category()) {
        return 500;
    }
    switch (static_cast<Errc>(ec.value())) {
        case Errc::not_found:           return 404;
        case Errc::invalid_input:       return 400;
        case Errc::unsatisfiable_range: return 416;
        case Errc::data_unavailable:    return 500;
        case Errc::io_failure:          return 500;
    }
    return 500;
}

ApiRouter::ApiRouter(ProjectRegistry& registry, const RangeStreamer& streamer)
    : registry_(registry), streamer_(streamer) {}

// ── handle ───────────────────────────────────────────────────────────────────

RouteResult ApiRouter::handle(const HttpRequest& request) const {
    if (request.method == "OPTIONS") {
        HttpResponse resp;
        resp.status = 204;
        resp.set_header("Access-Control-Allow-Methods", "GET, PUT, DELETE, OPTIONS");
        resp.set_header("Access-Control-Allow-Headers", "*");
        return resp;
    }

    const auto parts = split_path(request.path);
    try {
        return route(request, parts);
    } catch (const Error& e) {
        const auto status = status_for(e.code());
        if (status >= 500) {
            spdlog::error("{} {}: {}", request.method, request.path, e.what());
        } else {
            spdlog::debug("{} {}: {} ({})", request.method, request.path, status, e.what());
        }
        return error_response(status, e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} {}: unexpected failure: {}", request.method, request.path, e.what());
        return error_response(500, "Internal Server Error");
    }
}

RouteResult ApiRouter::route(const HttpRequest& request,
                             const std::vector<std::string>& parts) const {
    const auto& method = request.method;

    if (parts.empty() || parts[0] != "api") {
        return error_response(404, "Not Found");
    }

    // /api/projects
    if (parts.size() == 2 && parts[1] == "projects") {
        if (method != "GET") return method_not_allowed("GET");
        return list_projects();
    }

    if (parts.size() < 3) {
        return error_response(404, "Not Found");
    }
    const auto& project  = parts[1];
    const auto& resource = parts[2];

    if (resource == "project" && parts.size() == 3) {
        if (method != "GET") return method_not_allowed("GET");
        return project_info(project);
    }

    if (resource == "segments") {
        if (parts.size() == 3) {
            if (method != "GET") return method_not_allowed("GET");
            return list_segments(project, request);
        }
        if (parts.size() == 4) {
            const auto id = require_id(parts[3], "segment_id");
            if (method == "GET")    return get_segment(project, id);
            if (method == "PUT")    return update_segment(project, id, request);
            if (method == "DELETE") return delete_segment(project, id);
            return method_not_allowed("GET, PUT, DELETE");
        }
    }

    if (resource == "chunks") {
        if (parts.size() == 3) {
            if (method != "GET") return method_not_allowed("GET");
            return list_chunks(project);
        }
        if (parts.size() == 4) {
            if (method != "GET") return method_not_allowed("GET");
            return get_chunk(project, require_id(parts[3], "chunk_id"));
        }
    }

    if (resource == "audio" && parts.size() == 4) {
        if (method != "GET") return method_not_allowed("GET");
        return stream_audio(project, require_id(parts[3], "chunk_id"), request);
    }

    return error_response(404, "Not Found");
}

// ── Projects ─────────────────────────────────────────────────────────────────

HttpResponse ApiRouter::list_projects() const {
    json projects = json::array();
    const auto summaries = registry_.list_projects();
    for (const auto& summary : summaries) {
        projects.push_back(project_summary_to_json(summary));
    }
    return json_response(200, json{{"projects", projects}, {"total", summaries.size()}});
}

HttpResponse ApiRouter::project_info(const std::string& project) const {
    auto p = registry_.resolve(project);
    return json_response(200, json{{"name", p->name}, {"path", p->root.string()}});
}

// ── Segments ─────────────────────────────────────────────────────────────────

HttpResponse ApiRouter::list_segments(const std::string& project,
                                      const HttpRequest& request) const {
    auto p = registry_.resolve(project);

    std::vector<Segment> segments;
    if (auto it = request.query.find("chunk_id"); it != request.query.end()) {
        segments = p->segments.get_by_chunk(require_id(it->second, "chunk_id"));
    } else {
        segments = p->segments.get_all();
    }
    return json_response(200, json{{"segments", segments_to_json(segments)},
                                   {"total", segments.size()}});
}

HttpResponse ApiRouter::get_segment(const std::string& project, int64_t id) const {
    auto p = registry_.resolve(project);
    auto segment = p->segments.get_by_id(id);
    if (!segment) {
        return error_response(404, "Segment not found");
    }
    return json_response(200, segment_to_json(*segment));
}

HttpResponse ApiRouter::update_segment(const std::string& project, int64_t id,
                                       const HttpRequest& request) const {
    auto p = registry_.resolve(project);

    const auto update = parse_segment_update(request.body);
    if (update.empty()) {
        return error_response(400, "No valid updates provided");
    }

    auto segment = p->segments.update(id, update);
    if (!segment) {
        return error_response(404, "Segment not found");
    }
    return json_response(200, json{{"success", true}, {"segment", segment_to_json(*segment)}});
}

HttpResponse ApiRouter::delete_segment(const std::string& project, int64_t id) const {
    auto p = registry_.resolve(project);
    if (!p->segments.remove(id)) {
        return error_response(404, "Segment not found");
    }
    return json_response(200, json{{"success", true}, {"deleted_segment_id", id}});
}

// ── Chunks ───────────────────────────────────────────────────────────────────

HttpResponse ApiRouter::list_chunks(const std::string& project) const {
    auto p = registry_.resolve(project);
    const auto chunks = p->chunks.get_all();
    json arr = json::array();
    for (const auto& chunk : chunks) {
        arr.push_back(chunk_to_json(chunk));
    }
    return json_response(200, json{{"chunks", arr}, {"total", chunks.size()}});
}

HttpResponse ApiRouter::get_chunk(const std::string& project, int64_t id) const {
    auto p = registry_.resolve(project);
    auto chunk = p->chunks.get_by_id(id);
    if (!chunk) {
        return error_response(404, "Chunk not found");
    }
    return json_response(200, chunk_to_json(*chunk));
}

// ── Audio ────────────────────────────────────────────────────────────────────

RouteResult ApiRouter::stream_audio(const std::string& project, int64_t chunk_id,
                                    const HttpRequest& request) const {
    auto p = registry_.resolve(project);
    auto path = p->chunks.get_file_path(chunk_id);
    if (!path) {
        return error_response(404, "Audio file not found");
    }

    auto prepared = streamer_.prepare(*path, request.header("range"));
    if (auto* rejection = std::get_if<RangeRejection>(&prepared)) {
        return range_not_satisfiable(*rejection);
    }
    return std::move(std::get<PreparedStream>(prepared));
}

} // namespace segedit::network
