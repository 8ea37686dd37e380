#include "FileVoteStore.h"
#include "../lib/BinaryPack.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hv {

namespace {

struct FileHeader {
  uint32_t magic{ 0 };
  uint32_t version{ 0 };

  template <typename Archive> void serialize(Archive &ar) {
    ar &magic &version;
  }
};

std::string errnoMessage() { return std::strerror(errno); }

} // namespace

FileVoteStore::FileLock::FileLock(int fd, bool exclusive) : fd_(fd) {
  int rc = 0;
  do {
    rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
  } while (rc != 0 && errno == EINTR);
  locked_ = (rc == 0);
}

FileVoteStore::FileLock::~FileLock() {
  if (locked_) {
    ::flock(fd_, LOCK_UN);
  }
}

FileVoteStore::FileVoteStore() : VoteStore("hashvote.store.file") {}

FileVoteStore::~FileVoteStore() { close(); }

FileVoteStore::Roe<void> FileVoteStore::open(const std::string &filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    return Error(E_IO, "Ledger file is already open: " + filepath_);
  }
  if (filepath.empty()) {
    return Error(E_IO, "Ledger file path is not set");
  }

  std::filesystem::path parentDir = std::filesystem::path(filepath).parent_path();
  if (!parentDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(E_IO, "Failed to create directory " + parentDir.string() +
                             ": " + ec.message());
    }
  }

  int fd = ::open(filepath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Error(E_IO, "Failed to open ledger file " + filepath + ": " +
                           errnoMessage());
  }
  fd_ = fd;
  filepath_ = filepath;
  parsedOffset_ = HEADER_SIZE;
  index_.clear();

  Roe<void> result;
  {
    FileLock fileLock(fd_, true);
    if (!fileLock.isLocked()) {
      result = Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
    } else {
      auto size = fileSize();
      if (!size) {
        result = size.error();
      } else if (size.value() == 0) {
        result = writeHeader();
        if (result) {
          log().info << "Created ledger file: " << filepath_;
        }
      } else {
        result = checkHeader();
      }
      if (result) {
        result = refresh();
      }
    }
  }

  if (!result) {
    log().error << "Failed to open ledger " << filepath_ << ": "
                << result.error().message;
    ::close(fd_);
    fd_ = -1;
    return result;
  }

  log().debug << "Opened ledger " << filepath_ << " with " << index_.size()
              << " blocks";
  return {};
}

void FileVoteStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  index_.clear();
  parsedOffset_ = HEADER_SIZE;
}

FileVoteStore::Roe<void> FileVoteStore::writeHeader() {
  FileHeader header;
  header.magic = MAGIC;
  header.version = VERSION;
  std::string data = utl::binaryPack(header);
  auto result = writeExact(0, data.data(), data.size());
  if (!result) {
    return result;
  }
  if (::fsync(fd_) != 0) {
    return Error(E_IO, "Failed to sync ledger header: " + errnoMessage());
  }
  return {};
}

FileVoteStore::Roe<void> FileVoteStore::checkHeader() {
  std::string data(HEADER_SIZE, '\0');
  auto result = readExact(0, &data[0], HEADER_SIZE);
  if (!result) {
    return Error(E_CORRUPT, "Ledger header is truncated: " + filepath_);
  }
  auto header = utl::binaryUnpack<FileHeader>(data);
  if (!header || header.value().magic != MAGIC) {
    return Error(E_CORRUPT, "Not a ledger file: " + filepath_);
  }
  if (header.value().version != VERSION) {
    return Error(E_CORRUPT, "Unsupported ledger version " +
                                std::to_string(header.value().version));
  }
  return {};
}

FileVoteStore::Roe<void> FileVoteStore::refresh() {
  auto size = fileSize();
  if (!size) {
    return size.error();
  }

  uint64_t offset = parsedOffset_;
  while (offset + SIZE_PREFIX_BYTES <= size.value()) {
    std::string prefix(SIZE_PREFIX_BYTES, '\0');
    auto result = readExact(offset, &prefix[0], SIZE_PREFIX_BYTES);
    if (!result) {
      return result;
    }
    auto recordSize = utl::binaryUnpack<uint64_t>(prefix);
    if (!recordSize || recordSize.value() > MAX_RECORD_SIZE) {
      return Error(E_CORRUPT, "Invalid record size at offset " +
                                  std::to_string(offset));
    }
    if (offset + SIZE_PREFIX_BYTES + recordSize.value() > size.value()) {
      break;
    }

    std::string data(recordSize.value(), '\0');
    result = readExact(offset + SIZE_PREFIX_BYTES, &data[0], data.size());
    if (!result) {
      return result;
    }
    auto block = utl::binaryUnpack<VoteBlock>(data);
    if (!block) {
      return Error(E_CORRUPT, "Failed to decode record at offset " +
                                  std::to_string(offset) + ": " +
                                  block.error().message);
    }
    if (block.value().id != index_.nextId()) {
      return Error(E_CORRUPT, "Out of sequence block id " +
                                  std::to_string(block.value().id) +
                                  " at offset " + std::to_string(offset));
    }
    index_.add(block.value());
    offset += SIZE_PREFIX_BYTES + recordSize.value();
  }

  if (offset < size.value() && offset != parsedOffset_) {
    log().warning << "Ignoring " << (size.value() - offset)
                  << " bytes of incomplete trailing record in " << filepath_;
  }
  parsedOffset_ = offset;
  return {};
}

FileVoteStore::Roe<std::vector<VoteBlock>>
FileVoteStore::readPoll(const std::string &pollId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return Error(E_IO, "Ledger file is not open");
  }
  FileLock fileLock(fd_, false);
  if (!fileLock.isLocked()) {
    return Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
  }
  auto result = refresh();
  if (!result) {
    return result.error();
  }
  return index_.getPoll(pollId);
}

FileVoteStore::Roe<std::vector<VoteBlock>> FileVoteStore::readAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return Error(E_IO, "Ledger file is not open");
  }
  FileLock fileLock(fd_, false);
  if (!fileLock.isLocked()) {
    return Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
  }
  auto result = refresh();
  if (!result) {
    return result.error();
  }
  return index_.getBlocks();
}

FileVoteStore::Roe<std::string>
FileVoteStore::getTip(const std::string &pollId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return Error(E_IO, "Ledger file is not open");
  }
  FileLock fileLock(fd_, false);
  if (!fileLock.isLocked()) {
    return Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
  }
  auto result = refresh();
  if (!result) {
    return result.error();
  }
  return index_.getTip(pollId);
}

FileVoteStore::Roe<std::optional<VoteBlock>>
FileVoteStore::findVote(const std::string &pollId,
                        const std::string &voterHash) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return Error(E_IO, "Ledger file is not open");
  }
  FileLock fileLock(fd_, false);
  if (!fileLock.isLocked()) {
    return Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
  }
  auto result = refresh();
  if (!result) {
    return result.error();
  }
  const VoteBlock *found = index_.findVote(pollId, voterHash);
  if (!found) {
    return std::optional<VoteBlock>();
  }
  return std::optional<VoteBlock>(*found);
}

FileVoteStore::Roe<VoteBlock> FileVoteStore::append(const VoteBlock &block) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return Error(E_IO, "Ledger file is not open");
  }
  FileLock fileLock(fd_, true);
  if (!fileLock.isLocked()) {
    return Error(E_IO, "Failed to lock ledger file: " + errnoMessage());
  }

  auto result = refresh();
  if (!result) {
    return result.error();
  }
  result = index_.checkAppend(block);
  if (!result) {
    log().debug << "Rejected append to poll " << block.pollId << ": "
                << result.error().message;
    return result.error();
  }

  auto size = fileSize();
  if (!size) {
    return size.error();
  }
  if (size.value() > parsedOffset_) {
    log().warning << "Truncating incomplete trailing record at offset "
                  << parsedOffset_;
    if (::ftruncate(fd_, static_cast<off_t>(parsedOffset_)) != 0) {
      return Error(E_IO, "Failed to truncate ledger: " + errnoMessage());
    }
  }

  VoteBlock stored = block;
  stored.id = index_.nextId();
  std::string data = utl::binaryPack(stored);
  std::string record = utl::binaryPack(static_cast<uint64_t>(data.size()));
  record += data;

  result = writeExact(parsedOffset_, record.data(), record.size());
  if (result && ::fsync(fd_) != 0) {
    result = Error(E_IO, "Failed to sync ledger: " + errnoMessage());
  }
  if (!result) {
    if (::ftruncate(fd_, static_cast<off_t>(parsedOffset_)) != 0) {
      log().error << "Failed to roll back partial record: " << errnoMessage();
    }
    log().error << "Append failed: " << result.error().message;
    return result.error();
  }

  index_.add(stored);
  parsedOffset_ += record.size();
  log().debug << "Appended block " << stored.id << " to poll "
              << stored.pollId;
  return stored;
}

FileVoteStore::Roe<uint64_t> FileVoteStore::fileSize() const {
  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    return Error(E_IO, "Failed to stat ledger file: " + errnoMessage());
  }
  return static_cast<uint64_t>(st.st_size);
}

FileVoteStore::Roe<void> FileVoteStore::readExact(uint64_t offset, char *data,
                                                  uint64_t size) const {
  uint64_t done = 0;
  while (done < size) {
    ssize_t n = ::pread(fd_, data + done, size - done,
                        static_cast<off_t>(offset + done));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return Error(E_IO, "Failed to read ledger at offset " +
                             std::to_string(offset + done));
    }
    done += static_cast<uint64_t>(n);
  }
  return {};
}

FileVoteStore::Roe<void> FileVoteStore::writeExact(uint64_t offset,
                                                   const char *data,
                                                   uint64_t size) {
  uint64_t done = 0;
  while (done < size) {
    ssize_t n = ::pwrite(fd_, data + done, size - done,
                         static_cast<off_t>(offset + done));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return Error(E_IO, "Failed to write ledger at offset " +
                             std::to_string(offset + done) + ": " +
                             errnoMessage());
    }
    done += static_cast<uint64_t>(n);
  }
  return {};
}

} // namespace hv
