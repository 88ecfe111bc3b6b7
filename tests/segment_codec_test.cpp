#include "storage/segment.hpp"

#include <gtest/gtest.h>

#include <string>

namespace segedit {

namespace {

SegmentTable decode(const std::string& csv) {
    CsvDocument doc;
    EXPECT_FALSE(parse_csv(csv, doc));
    SegmentTable table;
    EXPECT_FALSE(decode_segments(doc, table));
    return table;
}

} // namespace

// ── decode_segments ──────────────────────────────────────────────────────────

TEST(DecodeSegments, ReadsAllKnownColumns) {
    auto table = decode(
        "segment_id,chunk_id,start_sec,end_sec,text,language,gap_type,speaker\n"
        "7,2,1.25,3.5,Hi,en,pause,SPEAKER_01\n");
    ASSERT_EQ(table.rows.size(), 1u);
    const auto& s = table.rows[0];
    EXPECT_EQ(s.segment_id, 7);
    EXPECT_EQ(s.chunk_id, 2);
    EXPECT_DOUBLE_EQ(*s.start_sec, 1.25);
    EXPECT_DOUBLE_EQ(*s.end_sec, 3.5);
    EXPECT_EQ(s.text, "Hi");
    EXPECT_EQ(s.language, "en");
    EXPECT_EQ(s.gap_type, "pause");
    EXPECT_EQ(s.speaker, "SPEAKER_01");
    EXPECT_TRUE(s.extra.empty());
}

TEST(DecodeSegments, EmptyAndNanTimesAreMissing) {
    auto table = decode(
        "segment_id,chunk_id,start_sec,end_sec,text\n"
        "1,0,,nan,x\n"
        "2,0,NaN,2.0,y\n");
    EXPECT_FALSE(table.rows[0].start_sec.has_value());
    EXPECT_FALSE(table.rows[0].end_sec.has_value());
    EXPECT_FALSE(table.rows[1].start_sec.has_value());
    EXPECT_DOUBLE_EQ(*table.rows[1].end_sec, 2.0);
}

TEST(DecodeSegments, FloatSpelledIdsAreAccepted) {
    auto table = decode("segment_id,chunk_id,start_sec,end_sec,text\n12.0,3.0,0,1,x\n");
    EXPECT_EQ(table.rows[0].segment_id, 12);
    EXPECT_EQ(table.rows[0].chunk_id, 3);
}

TEST(DecodeSegments, OptionalColumnsAbsentFromSchemaAreNullopt) {
    auto table = decode("segment_id,chunk_id,start_sec,end_sec,text\n1,0,0,1,x\n");
    EXPECT_FALSE(table.rows[0].language.has_value());
    EXPECT_FALSE(table.rows[0].gap_type.has_value());
    EXPECT_FALSE(table.rows[0].speaker.has_value());
    EXPECT_FALSE(table.has_column(columns::kSpeaker));
}

TEST(DecodeSegments, UnknownColumnsGoToExtra) {
    auto table = decode(
        "segment_id,confidence,chunk_id,start_sec,end_sec,text,notes\n"
        "1,0.93,0,0,1,x,\"check, later\"\n");
    const auto& extra = table.rows[0].extra;
    ASSERT_EQ(extra.size(), 2u);
    EXPECT_EQ(extra[0].first, "confidence");
    EXPECT_EQ(extra[0].second, "0.93");
    EXPECT_EQ(extra[1].first, "notes");
    EXPECT_EQ(extra[1].second, "check, later");
}

TEST(DecodeSegments, MissingRequiredColumnIsAnError) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("segment_id,chunk_id,start_sec,text\n1,0,0,x\n", doc));
    SegmentTable table;
    EXPECT_TRUE(decode_segments(doc, table));
}

TEST(DecodeSegments, MalformedCellsAreErrors) {
    for (const char* csv : {
             "segment_id,chunk_id,start_sec,end_sec,text\nabc,0,0,1,x\n",
             "segment_id,chunk_id,start_sec,end_sec,text\n1.5,0,0,1,x\n",
             "segment_id,chunk_id,start_sec,end_sec,text\n1,0,soon,1,x\n",
         }) {
        CsvDocument doc;
        ASSERT_FALSE(parse_csv(csv, doc));
        SegmentTable table;
        EXPECT_TRUE(decode_segments(doc, table)) << csv;
    }
}

TEST(DecodeSegments, OutOfRangeFloatIdIsAnError) {
    for (const char* csv : {
             "segment_id,chunk_id,start_sec,end_sec,text\n1e300,1,0.0,1.0,hi\n",
             "segment_id,chunk_id,start_sec,end_sec,text\n9.3e18,1,0.0,1.0,hi\n",
             "segment_id,chunk_id,start_sec,end_sec,text\n1,-1e19,0.0,1.0,hi\n",
         }) {
        CsvDocument doc;
        ASSERT_FALSE(parse_csv(csv, doc));
        SegmentTable table;
        EXPECT_TRUE(decode_segments(doc, table)) << csv;
    }
}

// ── encode_segments ──────────────────────────────────────────────────────────

TEST(EncodeSegments, PreservesColumnOrderAndExtraCells) {
    const std::string csv =
        "segment_id,confidence,chunk_id,start_sec,end_sec,text,speaker\n"
        "1,0.93,0,0.5,,\"a, \"\"b\"\"\",\n";
    auto table = decode(csv);
    EXPECT_EQ(write_csv(encode_segments(table)),
              "segment_id,confidence,chunk_id,start_sec,end_sec,text,speaker\n"
              "1,0.93,0,0.5,,\"a, \"\"b\"\"\",\n");
}

TEST(EncodeSegments, WholeSecondsKeepAFraction) {
    auto table = decode("segment_id,chunk_id,start_sec,end_sec,text\n1,0,2,3.0,x\n");
    auto doc = encode_segments(table);
    EXPECT_EQ(doc.rows[0][2], "2.0");
    EXPECT_EQ(doc.rows[0][3], "3.0");
}

// ── decode_chunks ────────────────────────────────────────────────────────────

TEST(DecodeChunks, MapsHumanReadableHeaders) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("Chunk ID,File Path,Start Time (s),End Time (s)\n"
                           "4,/audio/c4.wav,1200.0,1800.25\n", doc));
    std::vector<Chunk> chunks;
    ASSERT_FALSE(decode_chunks(doc, chunks));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk_id, 4);
    EXPECT_EQ(chunks[0].file_path, "/audio/c4.wav");
    EXPECT_DOUBLE_EQ(chunks[0].start_time, 1200.0);
    EXPECT_DOUBLE_EQ(chunks[0].end_time, 1800.25);
}

TEST(DecodeChunks, EmptyPathIsAnError) {
    CsvDocument doc;
    ASSERT_FALSE(parse_csv("Chunk ID,File Path,Start Time (s),End Time (s)\n4,,0,1\n", doc));
    std::vector<Chunk> chunks;
    EXPECT_TRUE(decode_chunks(doc, chunks));
}

// ── apply_update ─────────────────────────────────────────────────────────────

TEST(ApplyUpdate, OnlySetFieldsChange) {
    auto table = decode("segment_id,chunk_id,start_sec,end_sec,text\n1,0,0.5,1.5,old\n");
    SegmentUpdate update;
    update.text = "new";
    apply_update(table, update, table.rows[0]);
    EXPECT_EQ(table.rows[0].text, "new");
    EXPECT_DOUBLE_EQ(*table.rows[0].start_sec, 0.5);
    EXPECT_DOUBLE_EQ(*table.rows[0].end_sec, 1.5);
}

TEST(ApplyUpdate, EmptyUpdate) {
    EXPECT_TRUE(SegmentUpdate{}.empty());
    SegmentUpdate u;
    u.end_sec = 0.0;
    EXPECT_FALSE(u.empty());
}

// ── format_seconds ───────────────────────────────────────────────────────────

TEST(FormatSeconds, ShortestRoundTrip) {
    EXPECT_EQ(format_seconds(12.0), "12.0");
    EXPECT_EQ(format_seconds(0.25), "0.25");
    EXPECT_EQ(format_seconds(0.1), "0.1");
    EXPECT_EQ(format_seconds(-3.0), "-3.0");
}

} // namespace segedit
