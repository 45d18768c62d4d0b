#include "objsplit/checksum.hpp"

#include "objsplit/consts.hpp"
#include "objsplit/error.hpp"
#include "objsplit/tz.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace objsplit {

PayloadChecksumHasher::PayloadChecksumHasher(std::unique_ptr<Hasher> hasher,
                                             checksum_writer writer)
  : hasher_(std::move(hasher)), writer_(std::move(writer)) {}

void PayloadChecksumHasher::finalize() {
  if (finalized_) {
    throw std::logic_error("payload checksum already finalized");
  }
  finalized_ = true;
  const auto digest = hasher_->sum();
  writer_(digest);
}

PayloadChecksumHasher PayloadChecksumHasher::fork(checksum_writer writer) const {
  return PayloadChecksumHasher{hasher_->clone(), std::move(writer)};
}

checksum_writer sha256_writer(ObjectHeader &hdr) {
  return [&hdr](std::span<const std::uint8_t> cs) {
    if (cs.size() != consts::kSha256Size) {
      throw ChecksumLengthError(consts::kSha256Size, cs.size());
    }
    sha256_digest out{};
    std::copy(cs.begin(), cs.end(), out.begin());
    hdr.payload_checksum = out;
  };
}

checksum_writer tz_writer(ObjectHeader &hdr) {
  return [&hdr](std::span<const std::uint8_t> cs) {
    if (cs.size() != consts::kTzSize) {
      throw ChecksumLengthError(consts::kTzSize, cs.size());
    }
    tz::digest out{};
    std::copy(cs.begin(), cs.end(), out.begin());
    hdr.homomorphic_checksum = out;
  };
}

PayloadChecksums::PayloadChecksums(ObjectHeader &target)
  : sha256_(std::make_unique<Sha256Hasher>(), sha256_writer(target)),
    tz_(std::make_unique<tz::TzHasher>(), tz_writer(target)) {}

PayloadChecksums::PayloadChecksums(PayloadChecksumHasher sha, PayloadChecksumHasher tz)
  : sha256_(std::move(sha)), tz_(std::move(tz)) {}

void PayloadChecksums::update(std::span<const std::uint8_t> data) {
  sha256_.update(data);
  tz_.update(data);
}

void PayloadChecksums::finalize() {
  sha256_.finalize();
  tz_.finalize();
}

PayloadChecksums PayloadChecksums::fork(ObjectHeader &target) const {
  return PayloadChecksums{sha256_.fork(sha256_writer(target)), tz_.fork(tz_writer(target))};
}

} // namespace objsplit
