#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace pl {

/**
 * JournalFile is an append-only record file used for write-ahead persistence.
 *
 * File format:
 * - Header: magic, version, reserved, headerSize
 * - Records: [size (8 bytes)][data (size bytes)]*
 *
 * Every append is flushed before it returns. On open the file is scanned;
 * a torn final record (crash during append) is cut off.
 */
class JournalFile : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  using RecordVisitor = std::function<Roe<void>(const std::string &record)>;

  explicit JournalFile(const std::string &loggerName);
  ~JournalFile() override;

  JournalFile(const JournalFile &) = delete;
  JournalFile &operator=(const JournalFile &) = delete;

  /**
   * Open the journal, creating it with a fresh header if it does not exist
   * @param filepath Path to the journal file
   */
  Roe<void> open(const std::string &filepath);

  /**
   * Visit all records in file order. Stops at the first visitor error.
   */
  Roe<void> replay(const RecordVisitor &visitor);

  /**
   * Append one record and flush it to disk. On failure the file is cut back
   * to its previous size so no partial record remains.
   * @return Index of the record
   */
  Roe<uint64_t> append(const std::string &record);

  uint64_t getRecordCount() const;
  const std::string &getFilePath() const { return filepath_; }
  bool isOpen() const;
  void close();

private:
  struct FileHeader {
    static constexpr uint32_t MAGIC = 0x504C4A52; // "PLJR"
    static constexpr uint16_t CURRENT_VERSION = 1;

    uint32_t magic{ MAGIC };
    uint16_t version{ CURRENT_VERSION };
    uint16_t reserved{ 0 };
    uint64_t headerSize{ sizeof(FileHeader) };
  };

  static constexpr size_t HEADER_SIZE = sizeof(FileHeader);
  static constexpr size_t SIZE_PREFIX_BYTES = sizeof(uint64_t);
  static constexpr uint64_t MAX_RECORD_SIZE = 64 * 1024 * 1024;

  Roe<void> openStream();
  Roe<void> writeHeader();
  Roe<void> readHeader();
  Roe<void> scanRecords();
  Roe<void> truncateTo(uint64_t size);

  std::string filepath_;
  mutable std::mutex mutex_;
  std::fstream file_;
  uint64_t currentSize_{ 0 };
  uint64_t recordCount_{ 0 };
};

} // namespace pl
