#ifndef HASHVOTE_VOTE_STORE_HPP
#define HASHVOTE_VOTE_STORE_HPP

#include "VoteBlock.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hv {

/**
 * Storage port for the vote ledger.
 *
 * append() is the only write and is atomic: it checks that the block extends
 * the current tip of its poll and that neither (pollId, voterHash) nor
 * blockHash is already present, then stores the block and assigns its id.
 * Nothing is ever updated or deleted.
 */
class VoteStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DUPLICATE_VOTER = 1;
  constexpr static int32_t E_DUPLICATE_HASH = 2;
  // prevHash no longer matches the poll tip
  constexpr static int32_t E_STALE_TIP = 3;
  constexpr static int32_t E_IO = 4;
  constexpr static int32_t E_CORRUPT = 5;

  explicit VoteStore(const std::string &name) : Module(name) {}
  ~VoteStore() override = default;

  /**
   * Blocks of one poll in insertion order
   */
  virtual Roe<std::vector<VoteBlock>> readPoll(const std::string &pollId) = 0;

  /**
   * All blocks of the ledger in insertion order
   */
  virtual Roe<std::vector<VoteBlock>> readAll() = 0;

  /**
   * Block hash of the last block of a poll, or the genesis sentinel
   */
  virtual Roe<std::string> getTip(const std::string &pollId) = 0;

  virtual Roe<std::optional<VoteBlock>>
  findVote(const std::string &pollId, const std::string &voterHash) = 0;

  /**
   * Append a block. id is ignored on input and assigned by the store.
   * @return The stored block, with its id
   */
  virtual Roe<VoteBlock> append(const VoteBlock &block) = 0;
};

} // namespace hv

#endif // HASHVOTE_VOTE_STORE_HPP
