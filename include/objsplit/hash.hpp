#pragma once

#include "objsplit/consts.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// OpenSSL's EVP_MD_CTX; the full definition stays in <openssl/evp.h>.
struct evp_md_ctx_st;

namespace objsplit {

// Raw 32-byte SHA-256 digest (binary, not hex)
using sha256_digest = std::array<std::uint8_t, consts::kSha256Size>;

/**
 * Incremental hash algorithm.
 * sum() does not disturb the running state, so a hasher may keep
 * receiving bytes after a digest was taken from it.
 */
class Hasher {
public:
  virtual ~Hasher() = default;

  virtual void update(std::span<const std::uint8_t> data) = 0;
  [[nodiscard]] virtual std::vector<std::uint8_t> sum() const = 0;
  [[nodiscard]] virtual std::unique_ptr<Hasher> clone() const = 0;
  // Digest length in bytes.
  [[nodiscard]] virtual std::size_t size() const = 0;
};

// SHA-256 over the OpenSSL EVP digest API.
class Sha256Hasher final : public Hasher {
  // Only the class can mint one, so the copying constructor stays internal.
  struct copy_tag {
    explicit copy_tag() = default;
  };

public:
  Sha256Hasher();
  Sha256Hasher(const Sha256Hasher &other, copy_tag);

  Sha256Hasher(const Sha256Hasher &) = delete;
  Sha256Hasher &operator=(const Sha256Hasher &) = delete;

  void update(std::span<const std::uint8_t> data) override;
  [[nodiscard]] std::vector<std::uint8_t> sum() const override;
  [[nodiscard]] std::unique_ptr<Hasher> clone() const override;
  [[nodiscard]] std::size_t size() const override { return consts::kSha256Size; }

private:
  struct ctx_free {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };

  std::unique_ptr<evp_md_ctx_st, ctx_free> ctx_;
};

/** Compute SHA-256 of arbitrary bytes in one shot. */
sha256_digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline sha256_digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Lowercase hex of arbitrary bytes. */
std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Parse hex into exactly out.size() bytes.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, std::span<std::uint8_t> out);

} // namespace objsplit
