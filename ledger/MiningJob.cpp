#include "MiningJob.h"

namespace vnc {

const char *toString(MiningJob::State state) {
  switch (state) {
  case MiningJob::State::SEARCHING:
    return "searching";
  case MiningJob::State::FOUND:
    return "found";
  case MiningJob::State::CANCELLED:
    return "cancelled";
  default:
    return "unknown";
  }
}

MiningJob::MiningJob(Block candidate, uint32_t difficulty, std::string minerAddress)
    : block_(std::move(candidate)), difficulty_(difficulty),
      minerAddress_(std::move(minerAddress)) {
  block_.setNonce(0);
  block_.setHash("");
}

MiningJob::State MiningJob::step(uint64_t maxAttempts, const std::atomic<bool> *cancel) {
  for (uint64_t i = 0; i < maxAttempts && state_ == State::SEARCHING; i++) {
    if (cancel && cancel->load()) {
      state_ = State::CANCELLED;
      break;
    }

    std::string hash = block_.calculateHash();
    attempts_++;
    if (hasLeadingZeros(hash, difficulty_)) {
      block_.setHash(hash);
      state_ = State::FOUND;
      break;
    }
    block_.setNonce(block_.getNonce() + 1);
  }
  return state_;
}

MiningJob::State MiningJob::run(const std::atomic<bool> *cancel) {
  // Slices keep the loop shape identical to externally driven mining.
  constexpr uint64_t SLICE = 4096;
  while (state_ == State::SEARCHING) {
    step(SLICE, cancel);
  }
  return state_;
}

void MiningJob::cancel() {
  if (state_ == State::SEARCHING) {
    state_ = State::CANCELLED;
  }
}

} // namespace vnc
