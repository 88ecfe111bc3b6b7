#pragma once

#include "network/http_protocol.hpp"
#include "network/range_streamer.hpp"
#include "storage/project_registry.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace segedit::network {

// Either a complete response or an audio stream ready to be written.
using RouteResult = std::variant<HttpResponse, PreparedStream>;

// ── ApiRouter ────────────────────────────────────────────────────────────────
//
// Maps HTTP requests onto ProjectRegistry / SegmentStore / ChunkIndex calls
// and marshals the results as JSON:
//
//   GET    /api/projects
//   GET    /api/{project}/project
//   GET    /api/{project}/segments[?chunk_id=N]
//   GET    /api/{project}/segments/{id}
//   PUT    /api/{project}/segments/{id}
//   DELETE /api/{project}/segments/{id}
//   GET    /api/{project}/chunks
//   GET    /api/{project}/chunks/{id}
//   GET    /api/{project}/audio/{chunk_id}     (Range aware)
//
// segedit::Error codes map to statuses: not_found 404, invalid_input 400,
// unsatisfiable_range 416, data_unavailable and io_failure 500.
//
// Thread-safety: stateless apart from the registry, which is thread-safe.

class ApiRouter {
public:
    ApiRouter(ProjectRegistry& registry, const RangeStreamer& streamer);

    // Never throws for request-level failures; they become error responses.
    [[nodiscard]] RouteResult handle(const HttpRequest& request) const;

private:
    [[nodiscard]] RouteResult route(const HttpRequest& request,
                                    const std::vector<std::string>& parts) const;

    [[nodiscard]] HttpResponse list_projects() const;
    [[nodiscard]] HttpResponse project_info(const std::string& project) const;
    [[nodiscard]] HttpResponse list_segments(const std::string& project,
                                             const HttpRequest& request) const;
    [[nodiscard]] HttpResponse get_segment(const std::string& project, int64_t id) const;
    [[nodiscard]] HttpResponse update_segment(const std::string& project, int64_t id,
                                              const HttpRequest& request) const;
    [[nodiscard]] HttpResponse delete_segment(const std::string& project, int64_t id) const;
    [[nodiscard]] HttpResponse list_chunks(const std::string& project) const;
    [[nodiscard]] HttpResponse get_chunk(const std::string& project, int64_t id) const;
    [[nodiscard]] RouteResult stream_audio(const std::string& project, int64_t chunk_id,
                                           const HttpRequest& request) const;

    ProjectRegistry& registry_;
    const RangeStreamer& streamer_;
};

// Status code for a segedit error code; 500 for foreign categories.
[[nodiscard]] unsigned status_for(const std::error_code& ec) noexcept;

} // namespace segedit::network
