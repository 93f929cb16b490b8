#include "JournalFile.h"
#include "ErrorCodes.h"
#include <filesystem>

namespace pl {

JournalFile::JournalFile(const std::string &loggerName) : Module(loggerName) {}

JournalFile::~JournalFile() { close(); }

JournalFile::Roe<void> JournalFile::open(const std::string &filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    return Error(err::E_STORAGE, "Journal already open: " + filepath_);
  }
  if (filepath.empty()) {
    return Error(err::E_STORAGE, "Journal filepath is not set");
  }

  filepath_ = filepath;
  currentSize_ = 0;
  recordCount_ = 0;

  bool fileExists = std::filesystem::exists(filepath_);

  auto result = openStream();
  if (!result) {
    log().error << "Failed to open journal: " << filepath_;
    return result.error();
  }

  if (!fileExists || std::filesystem::file_size(filepath_) == 0) {
    auto headerResult = writeHeader();
    if (!headerResult) {
      log().error << "Failed to write header to new journal: " << filepath_;
      return headerResult.error();
    }
    currentSize_ = HEADER_SIZE;
    log().debug << "Created new journal: " << filepath_;
    return {};
  }

  auto headerResult = readHeader();
  if (!headerResult) {
    file_.close();
    return headerResult.error();
  }

  currentSize_ = std::filesystem::file_size(filepath_);
  auto scanResult = scanRecords();
  if (!scanResult) {
    file_.close();
    return scanResult.error();
  }

  log().debug << "Opened journal: " << filepath_ << " (" << recordCount_
              << " records, " << currentSize_ << " bytes)";
  return {};
}

JournalFile::Roe<void> JournalFile::openStream() {
  if (!std::filesystem::exists(filepath_)) {
    std::filesystem::path parentDir = std::filesystem::path(filepath_).parent_path();
    if (!parentDir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parentDir, ec);
      if (ec) {
        return Error(err::E_STORAGE, "Failed to create directory " +
                                         parentDir.string() + ": " + ec.message());
      }
    }
    std::ofstream create(filepath_, std::ios::binary);
    if (!create.is_open()) {
      return Error(err::E_STORAGE, "Failed to create file: " + filepath_);
    }
  }

  file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
  if (!file_.is_open()) {
    return Error(err::E_STORAGE, "Failed to open file: " + filepath_);
  }
  return {};
}

JournalFile::Roe<void> JournalFile::writeHeader() {
  FileHeader header;
  file_.seekp(0, std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&header), sizeof(FileHeader));
  file_.flush();
  if (!file_.good()) {
    return Error(err::E_STORAGE, "Failed to write header to file: " + filepath_);
  }
  return {};
}

JournalFile::Roe<void> JournalFile::readHeader() {
  FileHeader header;
  file_.seekg(0, std::ios::beg);
  file_.read(reinterpret_cast<char *>(&header), sizeof(FileHeader));

  if (file_.gcount() != static_cast<std::streamsize>(sizeof(FileHeader))) {
    return Error(err::E_STORAGE, "Failed to read complete header from file: " + filepath_);
  }
  if (header.magic != FileHeader::MAGIC) {
    return Error(err::E_STORAGE, "Invalid magic number in journal header: " + filepath_);
  }
  if (header.version > FileHeader::CURRENT_VERSION) {
    return Error(err::E_STORAGE, "Unsupported journal version " +
                                     std::to_string(header.version) + " (current: " +
                                     std::to_string(FileHeader::CURRENT_VERSION) + ")");
  }
  return {};
}

JournalFile::Roe<void> JournalFile::scanRecords() {
  uint64_t offset = HEADER_SIZE;
  uint64_t count = 0;

  file_.clear();
  while (offset + SIZE_PREFIX_BYTES <= currentSize_) {
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    uint64_t recordSize = 0;
    file_.read(reinterpret_cast<char *>(&recordSize), SIZE_PREFIX_BYTES);
    if (file_.gcount() != static_cast<std::streamsize>(SIZE_PREFIX_BYTES)) {
      break;
    }
    if (recordSize > MAX_RECORD_SIZE ||
        offset + SIZE_PREFIX_BYTES + recordSize > currentSize_) {
      break;
    }
    offset += SIZE_PREFIX_BYTES + recordSize;
    ++count;
  }
  file_.clear();

  if (offset != currentSize_) {
    log().warning << "Journal " << filepath_ << " has a torn tail of "
                  << (currentSize_ - offset) << " bytes after record " << count
                  << ", truncating";
    auto result = truncateTo(offset);
    if (!result) {
      return result.error();
    }
  }

  recordCount_ = count;
  return {};
}

JournalFile::Roe<void> JournalFile::truncateTo(uint64_t size) {
  file_.close();
  std::error_code ec;
  std::filesystem::resize_file(filepath_, size, ec);
  if (ec) {
    return Error(err::E_STORAGE, "Failed to truncate " + filepath_ + ": " + ec.message());
  }
  currentSize_ = size;
  return openStream();
}

JournalFile::Roe<void> JournalFile::replay(const RecordVisitor &visitor) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen()) {
    return Error(err::E_STORAGE, "Journal is not open: " + filepath_);
  }

  uint64_t offset = HEADER_SIZE;
  for (uint64_t i = 0; i < recordCount_; ++i) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    uint64_t recordSize = 0;
    file_.read(reinterpret_cast<char *>(&recordSize), SIZE_PREFIX_BYTES);
    std::string record(recordSize, '\0');
    if (recordSize > 0) {
      file_.read(&record[0], static_cast<std::streamsize>(recordSize));
    }
    if (!file_.good()) {
      file_.clear();
      return Error(err::E_STORAGE, "Failed to read record " + std::to_string(i) +
                                       " from " + filepath_);
    }

    auto result = visitor(record);
    if (!result) {
      return Error(result.error().code, "Record " + std::to_string(i) + ": " +
                                            result.error().message);
    }
    offset += SIZE_PREFIX_BYTES + recordSize;
  }
  file_.clear();
  return {};
}

JournalFile::Roe<uint64_t> JournalFile::append(const std::string &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen()) {
    return Error(err::E_STORAGE, "Journal is not open: " + filepath_);
  }
  if (record.size() > MAX_RECORD_SIZE) {
    return Error(err::E_STORAGE, "Record too large: " + std::to_string(record.size()));
  }

  uint64_t size = record.size();
  file_.clear();
  file_.seekp(static_cast<std::streamoff>(currentSize_), std::ios::beg);
  file_.write(reinterpret_cast<const char *>(&size), SIZE_PREFIX_BYTES);
  file_.write(record.data(), static_cast<std::streamsize>(size));
  file_.flush();

  if (!file_.good()) {
    log().error << "Failed to append record to journal: " << filepath_;
    file_.clear();
    auto rollback = truncateTo(currentSize_);
    if (!rollback) {
      log().critical << "Failed to roll back partial record: " << rollback.error().message;
    }
    return Error(err::E_STORAGE, "Failed to append record to journal: " + filepath_);
  }

  currentSize_ += SIZE_PREFIX_BYTES + size;
  return recordCount_++;
}

uint64_t JournalFile::getRecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return recordCount_;
}

bool JournalFile::isOpen() const { return file_.is_open(); }

void JournalFile::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
    log().debug << "Closed journal: " << filepath_ << " (records: " << recordCount_ << ")";
  }
}

} // namespace pl
