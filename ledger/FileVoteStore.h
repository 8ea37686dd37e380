#ifndef HASHVOTE_FILE_VOTE_STORE_H
#define HASHVOTE_FILE_VOTE_STORE_H

#include "LedgerIndex.h"
#include "VoteStore.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace hv {

/**
 * VoteStore backed by a single append-only file.
 *
 * File format:
 * - Header: [magic (4 bytes)][version (4 bytes)]
 * - Records: [size (8 bytes)][binaryPack(VoteBlock) (size bytes)]*
 *
 * All integers are big endian. Several processes may share one file:
 * append() takes an exclusive flock, catches up with records written by
 * others and only then validates and writes. Reads take a shared flock.
 * A truncated trailing record (crash during write) is ignored when reading
 * and cut off by the next append.
 */
class FileVoteStore : public VoteStore {
public:
  constexpr static uint32_t MAGIC = 0x48564C47; // "HVLG"
  constexpr static uint32_t VERSION = 1;
  constexpr static uint64_t HEADER_SIZE = 8;
  constexpr static uint64_t SIZE_PREFIX_BYTES = 8;
  constexpr static uint64_t MAX_RECORD_SIZE = 1024 * 1024;

  FileVoteStore();
  ~FileVoteStore() override;

  /**
   * Open the ledger file, creating it with a header if it does not exist
   * @param filepath Path to the ledger file
   */
  Roe<void> open(const std::string &filepath);
  void close();
  bool isOpen() const { return fd_ >= 0; }

  const std::string &getFilePath() const { return filepath_; }

  Roe<std::vector<VoteBlock>> readPoll(const std::string &pollId) override;
  Roe<std::vector<VoteBlock>> readAll() override;
  Roe<std::string> getTip(const std::string &pollId) override;
  Roe<std::optional<VoteBlock>>
  findVote(const std::string &pollId, const std::string &voterHash) override;
  Roe<VoteBlock> append(const VoteBlock &block) override;

private:
  // RAII holder for flock on fd_
  class FileLock {
  public:
    FileLock(int fd, bool exclusive);
    ~FileLock();
    bool isLocked() const { return locked_; }

  private:
    int fd_;
    bool locked_{ false };
  };

  Roe<void> writeHeader();
  Roe<void> checkHeader();

  /**
   * Parse records appended since the last refresh into index_.
   * Stops before an incomplete trailing record.
   * Caller holds mutex_ and a flock.
   */
  Roe<void> refresh();

  Roe<uint64_t> fileSize() const;
  Roe<void> readExact(uint64_t offset, char *data, uint64_t size) const;
  Roe<void> writeExact(uint64_t offset, const char *data, uint64_t size);

  std::string filepath_;
  int fd_{ -1 };
  // Offset just past the last complete record parsed into index_
  uint64_t parsedOffset_{ HEADER_SIZE };
  LedgerIndex index_;
  mutable std::mutex mutex_;
};

} // namespace hv

#endif // HASHVOTE_FILE_VOTE_STORE_H
