#include "objsplit/object_store.hpp"

#include "objsplit/consts.hpp"
#include "objsplit/fs.hpp"
#include "objsplit/hash.hpp"
#include "objsplit/tz.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

namespace ofs = objsplit::fs;

namespace objsplit {

namespace {

void verify_checksums(const ObjectHeader &hdr, std::span<const std::uint8_t> payload,
                      const std::string &what) {
  if (payload.size() != hdr.payload_size) {
    throw std::runtime_error(what + ": payload size mismatch");
  }
  if (!hdr.payload_checksum || !hdr.homomorphic_checksum) {
    throw std::runtime_error(what + ": missing payload checksum");
  }
  if (sha256(payload) != *hdr.payload_checksum) {
    throw std::runtime_error(what + ": payload checksum mismatch");
  }
  if (tz::sum(payload) != *hdr.homomorphic_checksum) {
    throw std::runtime_error(what + ": homomorphic checksum mismatch");
  }
}

} // namespace

std::filesystem::path ObjectStore::path_for_id(const object_id &id) const {
  const std::string hex = to_hex(id);
  const std::filesystem::path dir =
      store_dir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(const object_id &id) const { return ofs::exists(path_for_id(id)); }

object_id ObjectStore::write(const ObjectHeader &hdr, std::span<const std::uint8_t> payload) const {
  const std::string text = encode_header(hdr);
  std::vector<std::uint8_t> store;
  store.reserve(text.size() + 1 + payload.size());
  store.insert(store.end(), text.begin(), text.end());
  store.push_back(static_cast<std::uint8_t>(consts::kNul));
  store.insert(store.end(), payload.begin(), payload.end());

  const object_id id = sha256(store);
  const auto path = path_for_id(id);
  if (!ofs::exists(path)) {
    ofs::write_file_atomic(path, ofs::z_compress(store));
  }
  return id;
}

StoredObject ObjectStore::read(const object_id &id) const {
  const auto path = path_for_id(id);
  if (!ofs::exists(path)) {
    throw std::runtime_error("object_store: no such object: " + to_hex(id));
  }
  const auto store = ofs::z_decompress(ofs::read_file(path));
  if (sha256(store) != id) {
    throw std::runtime_error("object_store: corrupt object: " + to_hex(id));
  }

  const auto it_nul = std::ranges::find(store, static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  const std::string text(store.begin(), it_nul);
  return StoredObject{.header = decode_header(text), .payload = {it_nul + 1, store.end()}};
}

std::vector<std::uint8_t> ObjectStore::read_payload(const object_id &id) const {
  const StoredObject obj = read(id);
  const std::string hex = to_hex(id);

  if (obj.header.children.empty()) {
    if (obj.payload.size() < obj.header.payload_size) {
      throw std::runtime_error("object_store: " + hex + " carries no inline payload");
    }
    verify_checksums(obj.header, obj.payload, "object " + hex);
    return obj.payload;
  }

  // linking object: children in chain order, then the aggregate against the parent
  if (!obj.header.parent) {
    throw std::runtime_error("object_store: linking object " + hex + " has no parent");
  }
  const StoredObject parent = read(*obj.header.parent);

  std::vector<std::uint8_t> out;
  std::vector<tz::digest> parts;
  parts.reserve(obj.header.children.size());
  std::optional<object_id> prev;
  for (const auto &child_id : obj.header.children) {
    const StoredObject child = read(child_id);
    const std::string what = "chunk " + to_hex(child_id);
    if (child.header.previous != prev) {
      throw std::runtime_error(what + ": broken previous link");
    }
    verify_checksums(child.header, child.payload, what);
    parts.push_back(*child.header.homomorphic_checksum);
    out.insert(out.end(), child.payload.begin(), child.payload.end());
    prev = child_id;
  }

  const std::string what = "parent " + to_hex(*obj.header.parent);
  if (!parent.header.homomorphic_checksum) {
    throw std::runtime_error(what + ": missing homomorphic checksum");
  }
  if (!tz::validate(*parent.header.homomorphic_checksum, parts)) {
    throw std::runtime_error(what + ": chunks do not combine into the parent checksum");
  }
  verify_checksums(parent.header, out, what);
  return out;
}

TargetInitializer ObjectStore::target_initializer() const {
  return [store = *this]() -> std::unique_ptr<ObjectTarget> {
    return std::make_unique<LocalStoreTarget>(store);
  };
}

void LocalStoreTarget::write_header(const ObjectHeader &hdr) {
  if (closed_) {
    throw std::logic_error("local target: write_header after close");
  }
  if (header_) {
    throw std::logic_error("local target: header already written");
  }
  check_encodable(hdr);
  header_ = hdr;
}

std::size_t LocalStoreTarget::write(std::span<const std::uint8_t> data) {
  if (closed_) {
    throw std::logic_error("local target: write after close");
  }
  payload_.insert(payload_.end(), data.begin(), data.end());
  return data.size();
}

AccessIdentifiers LocalStoreTarget::close() {
  if (closed_) {
    throw std::logic_error("local target: already closed");
  }
  if (!header_) {
    throw std::runtime_error("local target: close without header");
  }
  if (payload_.size() > header_->payload_size) {
    throw std::runtime_error("local target: payload exceeds header size");
  }
  closed_ = true;
  const object_id id = store_.write(*header_, payload_);
  payload_.clear();
  return AccessIdentifiers{.self = id, .parent = header_->parent};
}

} // namespace objsplit
