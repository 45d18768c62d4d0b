#include "objsplit/object.hpp"

#include "objsplit/consts.hpp"
#include "objsplit/hash.hpp"

#include <array>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace objsplit {

namespace {

bool has_forbidden(std::string_view s) {
  return s.find(consts::kLF) != std::string_view::npos ||
         s.find(consts::kNul) != std::string_view::npos;
}

template <std::size_t N>
void parse_hex_field(std::string_view key, std::string_view hex, std::array<std::uint8_t, N> &out) {
  if (!from_hex(hex, out)) {
    throw std::runtime_error("object: bad " + std::string(key) + " hex");
  }
}

} // namespace

bool parse_id(std::string_view hex, object_id &out) { return from_hex(hex, out); }

ObjectHeader from_template(const ObjectHeader &src) {
  ObjectHeader res;
  res.container_id = src.container_id;
  res.owner_id = src.owner_id;
  res.attributes = src.attributes;
  return res;
}

void check_encodable(const ObjectHeader &hdr) {
  if (has_forbidden(hdr.container_id) || has_forbidden(hdr.owner_id)) {
    throw std::invalid_argument("object: container/owner must not contain LF or NUL");
  }
  for (const auto &a : hdr.attributes) {
    if (a.key.empty() || a.key.find(consts::kEq) != std::string::npos || has_forbidden(a.key) ||
        has_forbidden(a.value)) {
      throw std::invalid_argument("object: bad attribute key/value: " + a.key);
    }
  }
}

std::string encode_header(const ObjectHeader &hdr) {
  check_encodable(hdr);

  std::ostringstream os;
  os << consts::kKeyContainer << consts::kSpace << hdr.container_id << consts::kLF;
  os << consts::kKeyOwner << consts::kSpace << hdr.owner_id << consts::kLF;
  for (const auto &a : hdr.attributes) {
    os << consts::kKeyAttribute << consts::kSpace << a.key << consts::kEq << a.value << consts::kLF;
  }
  os << consts::kKeySize << consts::kSpace << hdr.payload_size << consts::kLF;
  if (hdr.payload_checksum) {
    os << consts::kKeyChecksum << consts::kSpace << to_hex(*hdr.payload_checksum) << consts::kLF;
  }
  if (hdr.homomorphic_checksum) {
    os << consts::kKeyHomomorphic << consts::kSpace << to_hex(*hdr.homomorphic_checksum)
       << consts::kLF;
  }
  if (hdr.previous) {
    os << consts::kKeyPrevious << consts::kSpace << to_hex(*hdr.previous) << consts::kLF;
  }
  if (hdr.parent) {
    os << consts::kKeyParent << consts::kSpace << to_hex(*hdr.parent) << consts::kLF;
  }
  for (const auto &child : hdr.children) {
    os << consts::kKeyChild << consts::kSpace << to_hex(child) << consts::kLF;
  }
  return os.str();
}

ObjectHeader decode_header(std::string_view text) {
  ObjectHeader hdr;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find(consts::kLF, pos);
    if (eol == std::string_view::npos) {
      throw std::runtime_error("object: header line not terminated");
    }
    const std::string_view line = text.substr(pos, eol - pos);
    pos = eol + 1;

    const std::size_t sp = line.find(consts::kSpace);
    if (sp == std::string_view::npos) {
      throw std::runtime_error("object: malformed header line");
    }
    const std::string_view key = line.substr(0, sp);
    const std::string_view value = line.substr(sp + 1);

    if (key == consts::kKeyContainer) {
      hdr.container_id = std::string(value);
    } else if (key == consts::kKeyOwner) {
      hdr.owner_id = std::string(value);
    } else if (key == consts::kKeyAttribute) {
      const std::size_t eq = value.find(consts::kEq);
      if (eq == std::string_view::npos || eq == 0) {
        throw std::runtime_error("object: malformed attribute");
      }
      hdr.attributes.push_back(
          Attribute{.key = std::string(value.substr(0, eq)), .value = std::string(value.substr(eq + 1))});
    } else if (key == consts::kKeySize) {
      std::uint64_t n = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        throw std::runtime_error("object: bad payload size");
      }
      hdr.payload_size = n;
    } else if (key == consts::kKeyChecksum) {
      parse_hex_field(key, value, hdr.payload_checksum.emplace());
    } else if (key == consts::kKeyHomomorphic) {
      parse_hex_field(key, value, hdr.homomorphic_checksum.emplace());
    } else if (key == consts::kKeyPrevious) {
      parse_hex_field(key, value, hdr.previous.emplace());
    } else if (key == consts::kKeyParent) {
      parse_hex_field(key, value, hdr.parent.emplace());
    } else if (key == consts::kKeyChild) {
      parse_hex_field(key, value, hdr.children.emplace_back());
    } else {
      throw std::runtime_error("object: unknown header key: " + std::string(key));
    }
  }
  return hdr;
}

} // namespace objsplit
