#pragma once
#include "objsplit/checksum.hpp"
#include "objsplit/error.hpp"
#include "objsplit/object.hpp"
#include "objsplit/target.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace objsplit {

/**
 * ObjectTarget that restricts the payload length of the object written
 * into it and streams the resulting split-chain into targets from the
 * initializer.
 *
 * An object whose payload fits into max_size is written as is. A larger
 * one is cut into chunks of exactly max_size bytes (the last may be
 * shorter), each linked to the previous one. On close a parent object
 * with the checksums of the whole payload and a linking object listing
 * every chunk are emitted as well.
 *
 * The chain depends only on the bytes written, not on how the caller
 * slices them across write() calls.
 *
 * Sink failures throw SplitError. Not thread-safe; not copyable or movable,
 * since the checksum accumulators point into its own headers.
 */
class PayloadSizeLimiter final : public ObjectTarget {
public:
  // Throws std::invalid_argument if max_size is 0 or init is empty.
  PayloadSizeLimiter(std::uint64_t max_size, TargetInitializer init);

  PayloadSizeLimiter(const PayloadSizeLimiter &) = delete;
  PayloadSizeLimiter &operator=(const PayloadSizeLimiter &) = delete;

  void write_header(const ObjectHeader &hdr) override;
  std::size_t write(std::span<const std::uint8_t> data) override;
  // Identifiers of the linking object if the payload was split, otherwise of the only chunk.
  AccessIdentifiers close() override;

  [[nodiscard]] std::uint64_t max_size() const { return max_size_; }
  [[nodiscard]] std::uint64_t written() const { return written_; }

private:
  void write_chunk(std::span<const std::uint8_t> chunk);
  void initialize();
  void initialize_current(SplitPhase phase);
  void initialize_linking(object_id parent_id);
  AccessIdentifiers release(bool close, SplitPhase phase);
  std::unique_ptr<ObjectTarget> new_target(SplitPhase phase) const;
  AccessIdentifiers flush(ObjectTarget &target, const ObjectHeader &hdr, SplitPhase phase) const;

  std::uint64_t max_size_;
  std::uint64_t written_ = 0;
  std::uint64_t current_written_ = 0; // bytes in the open chunk

  TargetInitializer target_init_;
  std::unique_ptr<ObjectTarget> target_;

  ObjectHeader current_;
  std::optional<ObjectHeader> parent_;

  std::optional<PayloadChecksums> current_hashers_;
  std::optional<PayloadChecksums> parent_hashers_;

  std::vector<object_id> previous_;

  bool header_written_ = false;
  bool closed_ = false;
};

} // namespace objsplit
