#pragma once
#include "objsplit/consts.hpp"
#include "objsplit/hash.hpp"
#include "objsplit/tz.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace objsplit {

// Raw 32-byte object identifier (binary, not hex)
using object_id = std::array<std::uint8_t, consts::kIdRawLen>;

// Parse 64-char hex into an id; false on bad length/characters.
bool parse_id(std::string_view hex, object_id &out);

struct Attribute {
  std::string key;
  std::string value;

  friend bool operator==(const Attribute &, const Attribute &) = default;
};

/**
 * Metadata of one physical object.
 * Chunks carry checksums over their own payload; a parent carries the
 * checksums of the whole logical payload; a linking object lists the
 * chunks in children.
 */
struct ObjectHeader {
  std::string container_id;
  std::string owner_id;
  std::vector<Attribute> attributes;

  std::uint64_t payload_size = 0;
  std::optional<sha256_digest> payload_checksum;
  std::optional<tz::digest> homomorphic_checksum;

  std::optional<object_id> previous;
  std::optional<object_id> parent;
  std::vector<object_id> children;
};

// Identifiers handed back by a target once an object is stored.
struct AccessIdentifiers {
  object_id self{};
  std::optional<object_id> parent;
};

/** Fresh header carrying only container, owner and attributes of src. */
ObjectHeader from_template(const ObjectHeader &src);

/**
 * Line-oriented header encoding:
 *   container <id>
 *   owner <id>
 *   attr <key>=<value>        (repeated)
 *   size <n>
 *   checksum <64 hex>
 *   homomorphic <128 hex>
 *   previous <64 hex>
 *   parent <64 hex>
 *   child <64 hex>            (repeated, in order)
 * Optional lines are omitted when unset.
 */
std::string encode_header(const ObjectHeader &hdr);
ObjectHeader decode_header(std::string_view text);

// Throws std::invalid_argument if a field cannot be encoded.
void check_encodable(const ObjectHeader &hdr);

} // namespace objsplit
