#include "../JournalFile.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace pl;

class JournalFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "payledger_journal_test";
    std::filesystem::remove_all(testDir_);
    std::filesystem::create_directories(testDir_);
    path_ = (testDir_ / "test.journal").string();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  std::vector<std::string> readAll(JournalFile &journal) {
    std::vector<std::string> records;
    auto result = journal.replay([&](const std::string &record) -> JournalFile::Roe<void> {
      records.push_back(record);
      return {};
    });
    EXPECT_TRUE(result.isOk());
    return records;
  }

  std::filesystem::path testDir_;
  std::string path_;
};

TEST_F(JournalFileTest, CreatesFileWithHeader) {
  JournalFile journal("test.journal");
  ASSERT_TRUE(journal.open(path_).isOk());
  EXPECT_TRUE(journal.isOpen());
  EXPECT_EQ(journal.getRecordCount(), 0u);
  EXPECT_GT(std::filesystem::file_size(path_), 0u);
}

TEST_F(JournalFileTest, AppendAndReplayInOrder) {
  JournalFile journal("test.journal");
  ASSERT_TRUE(journal.open(path_).isOk());

  auto first = journal.append("{\"n\":1}");
  auto second = journal.append("{\"n\":2}");
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(*first, 0u);
  EXPECT_EQ(*second, 1u);

  auto records = readAll(journal);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0], "{\"n\":1}");
  EXPECT_EQ(records[1], "{\"n\":2}");
}

TEST_F(JournalFileTest, ReopenKeepsRecords) {
  {
    JournalFile journal("test.journal");
    ASSERT_TRUE(journal.open(path_).isOk());
    ASSERT_TRUE(journal.append("alpha").isOk());
    ASSERT_TRUE(journal.append("beta").isOk());
  }
  JournalFile reopened("test.journal");
  ASSERT_TRUE(reopened.open(path_).isOk());
  EXPECT_EQ(reopened.getRecordCount(), 2u);
  ASSERT_TRUE(reopened.append("gamma").isOk());
  auto records = readAll(reopened);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[2], "gamma");
}

TEST_F(JournalFileTest, TornTailIsCutOnOpen) {
  {
    JournalFile journal("test.journal");
    ASSERT_TRUE(journal.open(path_).isOk());
    ASSERT_TRUE(journal.append("complete").isOk());
  }
  auto sizeAfterRecord = std::filesystem::file_size(path_);
  {
    // Size prefix promising 100 bytes followed by only 3
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    uint64_t size = 100;
    out.write(reinterpret_cast<const char *>(&size), sizeof(size));
    out.write("abc", 3);
  }

  JournalFile journal("test.journal");
  ASSERT_TRUE(journal.open(path_).isOk());
  EXPECT_EQ(journal.getRecordCount(), 1u);
  EXPECT_EQ(std::filesystem::file_size(path_), sizeAfterRecord);
  auto records = readAll(journal);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], "complete");
}

TEST_F(JournalFileTest, RejectsForeignFile) {
  {
    std::ofstream out(path_, std::ios::binary);
    out << "this is not a journal file at all";
  }
  JournalFile journal("test.journal");
  auto result = journal.open(path_);
  ASSERT_TRUE(result.isError());
  EXPECT_FALSE(journal.isOpen());
}

TEST_F(JournalFileTest, ReplayStopsAtVisitorError) {
  JournalFile journal("test.journal");
  ASSERT_TRUE(journal.open(path_).isOk());
  ASSERT_TRUE(journal.append("one").isOk());
  ASSERT_TRUE(journal.append("two").isOk());

  int visited = 0;
  auto result = journal.replay([&](const std::string &) -> JournalFile::Roe<void> {
    ++visited;
    return JournalFile::Error(99, "stop");
  });
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(visited, 1);
}
