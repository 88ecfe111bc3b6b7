#include "persistence/backup_writer.hpp"

#include "test_project.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;
using segedit::MockClock;
using segedit::persistence::BackupWriter;
using segedit::persistence::format_backup_timestamp;
using segedit::testing::read_file;
using segedit::testing::write_file;

class BackupWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = segedit::testing::make_temp_root("backup");
        source_ = root_ / "segments.csv";
        backup_dir_ = root_ / "backups";
    }
    void TearDown() override { fs::remove_all(root_); }

    fs::path root_;
    fs::path source_;
    fs::path backup_dir_;
    MockClock clock_;
};

TEST_F(BackupWriterTest, TimestampFormat) {
    std::regex pattern(R"(\d{8}_\d{6})");
    EXPECT_TRUE(std::regex_match(format_backup_timestamp(clock_.now()), pattern));
}

TEST_F(BackupWriterTest, BackupPathFollowsNamingScheme) {
    BackupWriter writer(backup_dir_, clock_);
    auto path = writer.backup_path_for(source_, clock_.now());
    EXPECT_EQ(path.parent_path(), backup_dir_);
    EXPECT_TRUE(std::regex_match(path.filename().string(),
                                 std::regex(R"(segments_\d{8}_\d{6}\.csv)")));
}

TEST_F(BackupWriterTest, CopiesBytesVerbatimAndCreatesDirectory) {
    const std::string content = "segment_id,text\r\n1,\"a\nb\"\n\xEF\xBB\xBF";
    write_file(source_, content);
    ASSERT_FALSE(fs::exists(backup_dir_));

    BackupWriter writer(backup_dir_, clock_);
    std::optional<fs::path> written;
    ASSERT_FALSE(writer.backup(source_, written));
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, writer.backup_path_for(source_, clock_.now()));
    EXPECT_EQ(read_file(*written), content);
}

TEST_F(BackupWriterTest, MissingSourceIsSkipped) {
    BackupWriter writer(backup_dir_, clock_);
    std::optional<fs::path> written;
    EXPECT_FALSE(writer.backup(source_, written));
    EXPECT_FALSE(written.has_value());
    EXPECT_TRUE(segedit::testing::list_dir(backup_dir_).empty());
}

TEST_F(BackupWriterTest, DistinctSecondsGiveDistinctBackups) {
    BackupWriter writer(backup_dir_, clock_);
    std::optional<fs::path> written;

    write_file(source_, "v1");
    ASSERT_FALSE(writer.backup(source_, written));
    clock_.advance(std::chrono::seconds(1));
    write_file(source_, "v2");
    ASSERT_FALSE(writer.backup(source_, written));

    EXPECT_EQ(segedit::testing::list_dir(backup_dir_).size(), 2u);
    EXPECT_EQ(read_file(*written), "v2");
}

TEST_F(BackupWriterTest, SameSecondOverwrites) {
    BackupWriter writer(backup_dir_, clock_);
    std::optional<fs::path> written;

    write_file(source_, "v1");
    ASSERT_FALSE(writer.backup(source_, written));
    write_file(source_, "v2");
    ASSERT_FALSE(writer.backup(source_, written));

    auto files = segedit::testing::list_dir(backup_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "v2");
}
