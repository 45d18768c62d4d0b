#include "objsplit/splitter.hpp"

#include "objsplit/error.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace objsplit {

namespace {

// Sends one span to the chunk target and to every accumulator tracking it.
class PayloadFanout {
public:
  PayloadFanout(ObjectTarget &target, PayloadChecksums &current, PayloadChecksums *parent,
                std::size_t committed)
    : target_(target), current_(current), parent_(parent), committed_(committed) {}

  void write(std::span<const std::uint8_t> data) {
    std::size_t n = 0;
    try {
      n = target_.write(data);
    } catch (const std::exception &e) {
      throw SplitError(SplitPhase::chunk_write, committed_,
                       std::string("could not write chunk to target: ") + e.what());
    }
    if (n != data.size()) {
      throw SplitError(SplitPhase::chunk_write, committed_,
                       "could not write chunk to target: short write (" + std::to_string(n) +
                           " of " + std::to_string(data.size()) + ")");
    }

    current_.update(data);
    if (parent_) {
      parent_->update(data);
    }
  }

private:
  ObjectTarget &target_;
  PayloadChecksums &current_;
  PayloadChecksums *parent_;
  std::size_t committed_;
};

} // namespace

PayloadSizeLimiter::PayloadSizeLimiter(std::uint64_t max_size, TargetInitializer init)
  : max_size_(max_size), target_init_(std::move(init)) {
  if (max_size_ == 0) {
    throw std::invalid_argument("payload size limiter: max size must be positive");
  }
  if (!target_init_) {
    throw std::invalid_argument("payload size limiter: missing target initializer");
  }
}

void PayloadSizeLimiter::write_header(const ObjectHeader &hdr) {
  if (closed_) {
    throw std::logic_error("payload size limiter: write_header after close");
  }
  if (header_written_) {
    throw std::logic_error("payload size limiter: header already written");
  }
  current_ = from_template(hdr);
  header_written_ = true;
}

std::size_t PayloadSizeLimiter::write(std::span<const std::uint8_t> data) {
  if (closed_) {
    throw std::logic_error("payload size limiter: write after close");
  }
  if (!header_written_) {
    throw std::logic_error("payload size limiter: write before header");
  }
  write_chunk(data);
  return data.size();
}

AccessIdentifiers PayloadSizeLimiter::close() {
  if (closed_) {
    throw std::logic_error("payload size limiter: already closed");
  }
  if (!header_written_) {
    throw std::logic_error("payload size limiter: close before header");
  }
  closed_ = true;

  // empty payload: the only chunk was never opened
  if (!target_) {
    initialize();
  }
  return release(true, SplitPhase::chunk_release);
}

void PayloadSizeLimiter::initialize() {
  // an object after the 1st
  if (const std::size_t ln = previous_.size(); ln > 0) {
    // the parent is set up once, when the 2nd object opens; its
    // accumulators carry over everything the 1st one has seen
    if (ln == 1) {
      parent_.emplace(from_template(current_));
      parent_hashers_.emplace(current_hashers_->fork(*parent_));
      current_ = from_template(*parent_);
    } else {
      current_ = from_template(current_);
    }

    current_.previous = previous_.back();
  }

  initialize_current(SplitPhase::chunk_write);
}

void PayloadSizeLimiter::initialize_current(SplitPhase phase) {
  target_ = new_target(phase);
  current_written_ = 0;
  current_hashers_.emplace(current_);
}

void PayloadSizeLimiter::initialize_linking(object_id parent_id) {
  current_ = from_template(current_);
  current_.children = previous_;
  current_.parent = parent_id;
}

AccessIdentifiers PayloadSizeLimiter::release(bool close, SplitPhase phase) {
  // Parent and linking objects are generated only on close and only if
  // the split-chain holds more than one object.
  const bool with_parent = close && !previous_.empty();

  if (with_parent) {
    parent_hashers_->finalize();
    parent_->payload_size = written_;

    auto parent_target = new_target(SplitPhase::parent_release);
    const AccessIdentifiers parent_ids =
        flush(*parent_target, *parent_, SplitPhase::parent_release);
    current_.parent = parent_ids.self;
  }

  current_hashers_->finalize();
  current_.payload_size = current_written_;

  const AccessIdentifiers ids = flush(*target_, current_, phase);
  target_.reset();

  if (phase != SplitPhase::chunk_release) {
    return ids;
  }
  previous_.push_back(ids.self);

  if (with_parent) {
    // copied: rebuilding current_ drops its parent reference
    const object_id parent_id = *current_.parent;
    initialize_linking(parent_id);
    initialize_current(SplitPhase::linking_release);
    return release(false, SplitPhase::linking_release);
  }
  return ids;
}

std::unique_ptr<ObjectTarget> PayloadSizeLimiter::new_target(SplitPhase phase) const {
  std::unique_ptr<ObjectTarget> target;
  try {
    target = target_init_();
  } catch (const std::exception &e) {
    throw SplitError(phase, previous_.size(), std::string("could not initialize target: ") + e.what());
  }
  if (!target) {
    throw SplitError(phase, previous_.size(), "could not initialize target: initializer returned none");
  }
  return target;
}

AccessIdentifiers PayloadSizeLimiter::flush(ObjectTarget &target, const ObjectHeader &hdr,
                                            SplitPhase phase) const {
  try {
    target.write_header(hdr);
  } catch (const std::exception &e) {
    throw SplitError(phase, previous_.size(), std::string("could not write header: ") + e.what());
  }
  try {
    return target.close();
  } catch (const std::exception &e) {
    throw SplitError(phase, previous_.size(), std::string("could not close target: ") + e.what());
  }
}

void PayloadSizeLimiter::write_chunk(std::span<const std::uint8_t> chunk) {
  while (!chunk.empty()) {
    // true if:
    //   1. this is the very first byte;
    //   2. the previous bytes reached exactly the boundary.
    if (written_ % max_size_ == 0) {
      // if 2. the full object is released first
      if (written_ > 0) {
        release(false, SplitPhase::chunk_release);
      }
      initialize();
    }

    const std::uint64_t left_to_edge = max_size_ - (written_ % max_size_);
    const auto cut = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), left_to_edge));

    // write bytes no further than the boundary of the current object
    PayloadFanout fanout{*target_, *current_hashers_,
                         parent_hashers_ ? &*parent_hashers_ : nullptr, previous_.size()};
    fanout.write(chunk.first(cut));

    written_ += cut;
    current_written_ += cut;
    chunk = chunk.subspan(cut);
  }
}

} // namespace objsplit
