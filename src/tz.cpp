// Tillich-Zemor hash over GF(2^127)
#include "objsplit/tz.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace objsplit::tz {

namespace {

constexpr std::uint64_t kTopBit = 1ULL << 63;
constexpr std::size_t kElemSize = 16;

void put_be64(std::uint8_t *dst, std::uint64_t v) {
  for (int i = 7; i >= 0; --i) {
    dst[i] = static_cast<std::uint8_t>(v & 0xFF);
    v >>= 8;
  }
}

std::uint64_t get_be64(const std::uint8_t *src) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | src[i];
  }
  return v;
}

bool bit_at(const gf127 &a, int i) {
  return i < 64 ? ((a.lo >> i) & 1U) != 0 : ((a.hi >> (i - 64)) & 1U) != 0;
}

// state * A, A = [[x, 1], [1, 0]]
void step_zero(matrix &s) {
  const gf127 s0 = s[0];
  const gf127 s2 = s[2];
  s[0] = add(mul_x(s0), s[1]);
  s[1] = s0;
  s[2] = add(mul_x(s2), s[3]);
  s[3] = s2;
}

// state * B, B = [[x, x + 1], [1, 1]]
void step_one(matrix &s) {
  const gf127 s0x = mul_x(s[0]);
  const gf127 s2x = mul_x(s[2]);
  const gf127 c0 = add(s0x, s[1]);
  const gf127 c2 = add(s2x, s[3]);
  s[1] = add(c0, s[0]);
  s[0] = c0;
  s[3] = add(c2, s[2]);
  s[2] = c2;
}

} // namespace

gf127 add(const gf127 &a, const gf127 &b) { return gf127{.lo = a.lo ^ b.lo, .hi = a.hi ^ b.hi}; }

gf127 mul_x(const gf127 &a) {
  gf127 r{.lo = a.lo << 1, .hi = (a.hi << 1) | (a.lo >> 63)};
  if (r.hi & kTopBit) {
    // x^127 == x^63 + 1
    r.hi &= ~kTopBit;
    r.lo ^= kTopBit | 1U;
  }
  return r;
}

gf127 mul(const gf127 &a, const gf127 &b) {
  gf127 r{};
  for (int i = 126; i >= 0; --i) {
    r = mul_x(r);
    if (bit_at(b, i)) {
      r = add(r, a);
    }
  }
  return r;
}

matrix identity() { return matrix{gf127{.lo = 1}, gf127{}, gf127{}, gf127{.lo = 1}}; }

matrix mul(const matrix &a, const matrix &b) {
  return matrix{
      add(mul(a[0], b[0]), mul(a[1], b[2])),
      add(mul(a[0], b[1]), mul(a[1], b[3])),
      add(mul(a[2], b[0]), mul(a[3], b[2])),
      add(mul(a[2], b[1]), mul(a[3], b[3])),
  };
}

digest encode(const matrix &m) {
  digest out{};
  for (std::size_t i = 0; i < m.size(); ++i) {
    put_be64(out.data() + (i * kElemSize), m[i].hi);
    put_be64(out.data() + (i * kElemSize) + 8, m[i].lo);
  }
  return out;
}

matrix decode(std::span<const std::uint8_t> d) {
  if (d.size() != consts::kTzSize) {
    throw std::invalid_argument("tz: digest must be 64 bytes");
  }
  matrix m{};
  for (std::size_t i = 0; i < m.size(); ++i) {
    m[i].hi = get_be64(d.data() + (i * kElemSize));
    m[i].lo = get_be64(d.data() + (i * kElemSize) + 8);
    if (m[i].hi & kTopBit) {
      throw std::invalid_argument("tz: digest element out of field");
    }
  }
  return m;
}

void TzHasher::update(std::span<const std::uint8_t> data) {
  for (const std::uint8_t byte : data) {
    for (int bit = 7; bit >= 0; --bit) {
      if ((byte >> bit) & 1U) {
        step_one(state_);
      } else {
        step_zero(state_);
      }
    }
  }
}

std::vector<std::uint8_t> TzHasher::sum() const {
  const digest d = encode(state_);
  return {d.begin(), d.end()};
}

std::unique_ptr<Hasher> TzHasher::clone() const { return std::make_unique<TzHasher>(*this); }

digest sum(std::span<const std::uint8_t> data) {
  TzHasher h;
  h.update(data);
  digest out{};
  const auto bytes = h.sum();
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

digest concat(std::span<const digest> parts) {
  matrix acc = identity();
  for (const auto &p : parts) {
    acc = mul(acc, decode(p));
  }
  return encode(acc);
}

bool validate(const digest &whole, std::span<const digest> parts) { return concat(parts) == whole; }

} // namespace objsplit::tz
