#include "network/json_codec.hpp"

#include "common/errors.hpp"

#include <cmath>

namespace segedit::network {

namespace {

json optional_number(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return nullptr;
    }
    return *value;
}

json optional_string(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

std::optional<double> number_member(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw Error(Errc::invalid_input, std::string(key) + " must be a number");
    }
    const double value = it->get<double>();
    if (!std::isfinite(value)) {
        throw Error(Errc::invalid_input, std::string(key) + " must be finite");
    }
    return value;
}

} // namespace

json segment_to_json(const Segment& segment) {
    json out = {
        {"segment_id", segment.segment_id},
        {"chunk_id",   segment.chunk_id},
        {"start_sec",  optional_number(segment.start_sec)},
        {"end_sec",    optional_number(segment.end_sec)},
        {"text",       segment.text},
        {"language",   optional_string(segment.language)},
        {"gap_type",   optional_string(segment.gap_type)},
        {"speaker",    optional_string(segment.speaker)},
    };
    for (const auto& [column, value] : segment.extra) {
        // A duplicated header never shadows a typed field.
        if (out.contains(column)) {
            continue;
        }
        out[column] = value.empty() ? json(nullptr) : json(value);
    }
    return out;
}

json segments_to_json(const std::vector<Segment>& segments) {
    json arr = json::array();
    for (const auto& s : segments) {
        arr.push_back(segment_to_json(s));
    }
    return arr;
}

json chunk_to_json(const Chunk& chunk) {
    return {
        {"chunk_id",   chunk.chunk_id},
        {"file_path",  chunk.file_path.string()},
        {"start_time", chunk.start_time},
        {"end_time",   chunk.end_time},
    };
}

json project_summary_to_json(const ProjectSummary& summary) {
    return {
        {"name",     summary.name},
        {"duration", summary.duration},
    };
}

SegmentUpdate parse_segment_update(std::string_view body) {
    const json parsed = json::parse(body.begin(), body.end(), nullptr, false);
    if (parsed.is_discarded()) {
        throw Error(Errc::invalid_input, "Request body is not valid JSON");
    }
    if (!parsed.is_object()) {
        throw Error(Errc::invalid_input, "Request body must be a JSON object");
    }

    SegmentUpdate update;
    update.start_sec = number_member(parsed, "start_sec");
    update.end_sec   = number_member(parsed, "end_sec");

    if (auto it = parsed.find("text"); it != parsed.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw Error(Errc::invalid_input, "text must be a string");
        }
        update.text = it->get<std::string>();
    }
    return update;
}

HttpResponse json_response(unsigned status, const json& body) {
    HttpResponse resp;
    resp.status = status;
    resp.set_header("Content-Type", "application/json");
    // Invalid UTF-8 in CSV text is replaced rather than failing the response.
    resp.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return resp;
}

HttpResponse error_response(unsigned status, std::string_view detail) {
    return json_response(status, json{{"detail", std::string(detail)}});
}

} // namespace segedit::network
