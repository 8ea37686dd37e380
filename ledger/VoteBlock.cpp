#include "VoteBlock.h"
#include "../lib/Utilities.h"

namespace hv {

pow::BlockFields VoteBlock::fields() const {
  pow::BlockFields f;
  f.pollId = pollId;
  f.voterHash = voterHash;
  f.choice = choice;
  f.timestampUs = timestampUs;
  f.prevHash = prevHash;
  return f;
}

std::string VoteBlock::computeHash() const {
  return pow::computeHash(fields(), nonce);
}

std::string VoteBlock::timestampString() const {
  return utl::formatIsoMicros(timestampUs);
}

nlohmann::json VoteBlock::ltsToJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["pollId"] = pollId;
  j["voterHash"] = voterHash;
  j["choice"] = choice;
  j["timestamp"] = timestampString();
  j["prevHash"] = prevHash;
  j["nonce"] = nonce;
  j["blockHash"] = blockHash;
  return j;
}

} // namespace hv
