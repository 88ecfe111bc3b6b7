#pragma once

#include "network/http_protocol.hpp"
#include "storage/project_registry.hpp"
#include "storage/segment.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace segedit::network {

using json = nlohmann::json;

// ── Encoding ──────────────────────────────────────────────────────────────────
//
// Missing numbers and absent optional columns are emitted as null.

[[nodiscard]] json segment_to_json(const Segment& segment);

[[nodiscard]] json segments_to_json(const std::vector<Segment>& segments);

[[nodiscard]] json chunk_to_json(const Chunk& chunk);

[[nodiscard]] json project_summary_to_json(const ProjectSummary& summary);

// ── Decoding ──────────────────────────────────────────────────────────────────

// Body of PUT /segments/{id}: {"start_sec": number?, "end_sec": number?,
// "text": string?}. Null members count as unset; other keys are ignored.
// Throws Error(Errc::invalid_input) on malformed JSON, a non-object body or a
// member of the wrong type.
[[nodiscard]] SegmentUpdate parse_segment_update(std::string_view body);

// ── Responses ─────────────────────────────────────────────────────────────────

[[nodiscard]] HttpResponse json_response(unsigned status, const json& body);

// {"detail": message}
[[nodiscard]] HttpResponse error_response(unsigned status, std::string_view detail);

} // namespace segedit::network
