#include "objsplit/hash.hpp"
#include "objsplit/consts.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace objsplit {

void Sha256Hasher::ctx_free::operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
}

Sha256Hasher::Sha256Hasher(const Sha256Hasher &other, copy_tag) : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_MD_CTX_copy_ex(ctx_.get(), other.ctx_.get()) != 1) {
    throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
  }
}

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::vector<std::uint8_t> Sha256Hasher::sum() const {
  // Finalize a copy so the running state keeps accepting bytes.
  Sha256Hasher snapshot{*this, copy_tag{}};
  std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(snapshot.ctx_.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  out.resize(len);
  return out;
}

std::unique_ptr<Hasher> Sha256Hasher::clone() const {
  return std::make_unique<Sha256Hasher>(*this, copy_tag{});
}

sha256_digest sha256(std::span<const std::uint8_t> data) {
  Sha256Hasher h;
  h.update(data);
  const auto bytes = h.sum();
  if (bytes.size() != consts::kSha256Size) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  sha256_digest out{};
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    unsigned b = bytes[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, std::span<std::uint8_t> out) {
  if (hex.size() != out.size() * 2) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < out.size(); ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace objsplit
