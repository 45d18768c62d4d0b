#pragma once
#include "objsplit/hash.hpp"
#include "objsplit/object.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace objsplit {

// Receives the final digest bytes of a PayloadChecksumHasher.
using checksum_writer = std::function<void(std::span<const std::uint8_t>)>;

/**
 * One hash algorithm plus the callback that stores its digest.
 * finalize() may be called only once.
 */
class PayloadChecksumHasher {
public:
  PayloadChecksumHasher(std::unique_ptr<Hasher> hasher, checksum_writer writer);

  void update(std::span<const std::uint8_t> data) { hasher_->update(data); }
  void finalize();

  // Copy of the running state, reporting into another writer.
  [[nodiscard]] PayloadChecksumHasher fork(checksum_writer writer) const;

private:
  std::unique_ptr<Hasher> hasher_;
  checksum_writer writer_;
  bool finalized_ = false;
};

// Writers that validate the digest length and set the typed checksum on hdr.
checksum_writer sha256_writer(ObjectHeader &hdr);
checksum_writer tz_writer(ObjectHeader &hdr);

/**
 * Standard + homomorphic checksum pair driven in lock-step.
 * The target header must outlive the accumulator.
 */
class PayloadChecksums {
public:
  explicit PayloadChecksums(ObjectHeader &target);

  void update(std::span<const std::uint8_t> data);
  void finalize();

  // Same accumulated state, now writing into target.
  [[nodiscard]] PayloadChecksums fork(ObjectHeader &target) const;

private:
  PayloadChecksums(PayloadChecksumHasher sha, PayloadChecksumHasher tz);

  PayloadChecksumHasher sha256_;
  PayloadChecksumHasher tz_;
};

} // namespace objsplit
