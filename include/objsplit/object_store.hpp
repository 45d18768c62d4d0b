#pragma once
#include "objsplit/object.hpp"
#include "objsplit/target.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace objsplit {

struct StoredObject {
  ObjectHeader header;
  std::vector<std::uint8_t> payload; // bytes streamed into the object (none for a parent)
};

/**
 * Content-addressed store of physical objects under <dir>/objects.
 * Stored form is encode_header(hdr) + '\0' + payload, zlib-compressed;
 * the id is SHA-256 of the uncompressed stored form.
 */
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path store_dir)
    : store_dir_(std::move(store_dir)) {}

  [[nodiscard]] object_id write(const ObjectHeader &hdr, std::span<const std::uint8_t> payload) const;
  [[nodiscard]] StoredObject read(const object_id &id) const;
  [[nodiscard]] bool contains(const object_id &id) const;

  /**
   * Logical payload addressed by id.
   * A linking object yields its children's payloads in order, each chunk
   * and the aggregate verified against their checksums. Any other object
   * with inline payload yields that payload after verification. A parent
   * object has no inline payload and is rejected.
   * Throws std::runtime_error on a verification failure.
   */
  [[nodiscard]] std::vector<std::uint8_t> read_payload(const object_id &id) const;

  // Get filesystem path for an id.
  [[nodiscard]] std::filesystem::path path_for_id(const object_id &id) const;

  // Targets writing into this store, one per object.
  [[nodiscard]] TargetInitializer target_initializer() const;

private:
  std::filesystem::path store_dir_;
};

/** ObjectTarget buffering one object and writing it to an ObjectStore on close. */
class LocalStoreTarget final : public ObjectTarget {
public:
  explicit LocalStoreTarget(ObjectStore store) : store_(std::move(store)) {}

  void write_header(const ObjectHeader &hdr) override;
  std::size_t write(std::span<const std::uint8_t> data) override;
  AccessIdentifiers close() override;

private:
  ObjectStore store_;
  std::optional<ObjectHeader> header_;
  std::vector<std::uint8_t> payload_;
  bool closed_ = false;
};

} // namespace objsplit
