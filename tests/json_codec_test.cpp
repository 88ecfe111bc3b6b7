#include "network/json_codec.hpp"

#include "common/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace segedit;
using namespace segedit::network;

// ── Encoding ──────────────────────────────────────────────────────────────────

TEST(SegmentToJson, AllFields) {
    Segment s;
    s.segment_id = 4;
    s.chunk_id = 1;
    s.start_sec = 0.5;
    s.end_sec = 2.0;
    s.text = "Hola";
    s.language = "es";
    s.speaker = "SPEAKER_02";

    auto j = segment_to_json(s);
    EXPECT_EQ(j["segment_id"], 4);
    EXPECT_EQ(j["chunk_id"], 1);
    EXPECT_DOUBLE_EQ(j["start_sec"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(j["end_sec"].get<double>(), 2.0);
    EXPECT_EQ(j["text"], "Hola");
    EXPECT_EQ(j["language"], "es");
    EXPECT_EQ(j["speaker"], "SPEAKER_02");
    ASSERT_TRUE(j.contains("gap_type"));
    EXPECT_TRUE(j["gap_type"].is_null());
}

TEST(SegmentToJson, MissingNumbersAreNullNeverNan) {
    Segment s;
    s.end_sec = std::numeric_limits<double>::quiet_NaN();
    auto j = segment_to_json(s);
    EXPECT_TRUE(j["start_sec"].is_null());
    EXPECT_TRUE(j["end_sec"].is_null());
    EXPECT_EQ(j.dump().find("NaN"), std::string::npos);
}

TEST(SegmentToJson, ExtraColumnsAreIncluded) {
    Segment s;
    s.extra = {{"confidence", "0.9"}, {"notes", ""}};
    auto j = segment_to_json(s);
    EXPECT_EQ(j["confidence"], "0.9");
    EXPECT_TRUE(j["notes"].is_null());
}

TEST(SegmentToJson, ExtraColumnsNeverOverrideKnownFields) {
    Segment s;
    s.segment_id = 7;
    s.text = "real";
    s.extra = {{"text", "dup"}, {"segment_id", "99"}, {"confidence", "0.9"}};
    auto j = segment_to_json(s);
    EXPECT_EQ(j["text"], "real");
    EXPECT_EQ(j["segment_id"], 7);
    EXPECT_EQ(j["confidence"], "0.9");
}

TEST(ChunkToJson, Fields) {
    Chunk c{3, "/p/chunks/chunk_3.wav", 10.0, 20.5};
    auto j = chunk_to_json(c);
    EXPECT_EQ(j["chunk_id"], 3);
    EXPECT_EQ(j["file_path"], "/p/chunks/chunk_3.wav");
    EXPECT_DOUBLE_EQ(j["end_time"].get<double>(), 20.5);
}

// ── Decoding ──────────────────────────────────────────────────────────────────

TEST(ParseSegmentUpdate, AllFields) {
    auto u = parse_segment_update(R"({"start_sec": 1, "end_sec": 2.5, "text": "hi"})");
    EXPECT_DOUBLE_EQ(*u.start_sec, 1.0);
    EXPECT_DOUBLE_EQ(*u.end_sec, 2.5);
    EXPECT_EQ(u.text, "hi");
}

TEST(ParseSegmentUpdate, NullsAndUnknownKeysAreUnset) {
    auto u = parse_segment_update(R"({"start_sec": null, "speaker": "X", "segment_id": 9})");
    EXPECT_TRUE(u.empty());
}

TEST(ParseSegmentUpdate, EmptyStringIsAValidText) {
    auto u = parse_segment_update(R"({"text": ""})");
    ASSERT_TRUE(u.text.has_value());
    EXPECT_EQ(*u.text, "");
}

TEST(ParseSegmentUpdate, RejectsBadBodies) {
    for (const char* body : {"", "not json", "[1,2]", "42",
                             R"({"start_sec": "1.0"})", R"({"text": 5})"}) {
        try {
            (void)parse_segment_update(body);
            ADD_FAILURE() << "expected invalid_input for " << body;
        } catch (const Error& e) {
            EXPECT_TRUE(e.is(Errc::invalid_input)) << body;
        }
    }
}

// ── Responses ─────────────────────────────────────────────────────────────────

TEST(JsonResponse, SetsContentType) {
    auto resp = json_response(201, json{{"a", 1}});
    EXPECT_EQ(resp.status, 201u);
    EXPECT_EQ(resp.header("Content-Type"), "application/json");
    EXPECT_EQ(resp.body, R"({"a":1})");
}

TEST(JsonResponse, InvalidUtf8IsReplaced) {
    auto resp = json_response(200, json{{"text", std::string("bad \xff byte")}});
    EXPECT_EQ(json::parse(resp.body)["text"], "bad \xEF\xBF\xBD byte");
}

TEST(ErrorResponse, DetailBody) {
    auto resp = error_response(404, "Segment not found");
    EXPECT_EQ(resp.status, 404u);
    EXPECT_EQ(json::parse(resp.body), json({{"detail", "Segment not found"}}));
}
