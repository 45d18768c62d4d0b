#pragma once

#include "objsplit/consts.hpp"
#include "objsplit/hash.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace objsplit::tz {

using digest = std::array<std::uint8_t, consts::kTzSize>;

/**
 * Element of GF(2^127) modulo x^127 + x^63 + 1.
 * Bit i of the polynomial lives in word i / 64 (little-endian words);
 * bit 63 of the high word is always clear.
 */
struct gf127 {
  std::uint64_t lo = 0;
  std::uint64_t hi = 0;

  friend bool operator==(const gf127 &, const gf127 &) = default;
};

gf127 add(const gf127 &a, const gf127 &b);
gf127 mul_x(const gf127 &a);
gf127 mul(const gf127 &a, const gf127 &b);

// 2x2 matrix over GF(2^127), row-major.
using matrix = std::array<gf127, 4>;

matrix identity();
matrix mul(const matrix &a, const matrix &b);

// Digest <-> matrix, each element as 16 bytes big-endian, row-major.
digest encode(const matrix &m);
matrix decode(std::span<const std::uint8_t> d);

/**
 * Tillich-Zemor hash. Homomorphic with respect to concatenation:
 *   h(a || b) == h(a) * h(b)
 * so digests of consecutive pieces combine into the digest of the whole.
 */
class TzHasher final : public Hasher {
public:
  TzHasher() = default;

  void update(std::span<const std::uint8_t> data) override;
  [[nodiscard]] std::vector<std::uint8_t> sum() const override;
  [[nodiscard]] std::unique_ptr<Hasher> clone() const override;
  [[nodiscard]] std::size_t size() const override { return consts::kTzSize; }

private:
  matrix state_ = identity();
};

digest sum(std::span<const std::uint8_t> data);

/** Combine digests of consecutive pieces into the digest of their concatenation. */
digest concat(std::span<const digest> parts);

/** True if the ordered parts combine into whole. */
bool validate(const digest &whole, std::span<const digest> parts);

} // namespace objsplit::tz
