#include "objsplit/hash.hpp"
#include "objsplit/tz.hpp"
#include "recording_target.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace tz = objsplit::tz;

namespace {

std::span<const std::uint8_t> bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

int check_field() {
  // x^126 * x == x^127 == x^63 + 1
  const tz::gf127 x126{.lo = 0, .hi = 1ULL << 62};
  const tz::gf127 reduced = tz::mul_x(x126);
  if (reduced != (tz::gf127{.lo = (1ULL << 63) | 1U, .hi = 0})) {
    std::cerr << "reduction by x^127 + x^63 + 1\n";
    return 1;
  }

  const tz::gf127 a{.lo = 0x0123456789abcdefULL, .hi = 0x0fedcba987654321ULL};
  const tz::gf127 b{.lo = 0xdeadbeefcafebabeULL, .hi = 0x1122334455667788ULL};
  const tz::gf127 c{.lo = 0x0f0f0f0f0f0f0f0fULL, .hi = 0x70f0f0f0f0f0f0f0ULL};
  const tz::gf127 one{.lo = 1};
  if (tz::mul(a, one) != a) {
    std::cerr << "multiplicative identity\n";
    return 1;
  }
  if (tz::mul(a, b) != tz::mul(b, a)) {
    std::cerr << "multiplication commutes\n";
    return 1;
  }
  if (tz::mul(a, tz::add(b, c)) != tz::add(tz::mul(a, b), tz::mul(a, c))) {
    std::cerr << "distributivity\n";
    return 1;
  }
  if (tz::mul(a, tz::gf127{.lo = 2}) != tz::mul_x(a)) {
    std::cerr << "mul by x matches mul_x\n";
    return 1;
  }
  return 0;
}

int check_empty_is_identity() {
  const tz::digest d = tz::sum(std::span<const std::uint8_t>{});
  if (d != tz::encode(tz::identity())) {
    std::cerr << "digest of nothing is the identity matrix\n";
    return 1;
  }
  if (!(d[15] == 1 && d[63] == 1 && d[31] == 0 && d[47] == 0)) {
    std::cerr << "row-major big-endian layout\n";
    return 1;
  }
  return 0;
}

// Digests as produced by tzhash's tz.New() for the same input.
int check_known_digests() {
  // one zero byte is A^8 = [[x^8+x^6+x^4+1, x^7], [x^7, x^6+x^4+1]]
  const std::vector<std::uint8_t> zero{0};
  if (objsplit::to_hex(tz::sum(zero)) !=
      "0000000000000000000000000000015100000000000000000000000000000080"
      "0000000000000000000000000000008000000000000000000000000000000051") {
    std::cerr << "digest of a single zero byte\n";
    return 1;
  }

  const std::vector<std::uint8_t> counting{0, 1, 2, 3, 4, 5, 6, 7, 8};
  if (objsplit::to_hex(tz::sum(counting)) !=
      "00000000000001e4a545e5b90fb6882b00000000000000c849cd88f79307f671"
      "00000000000000cd0c898cb68356e624000000000000007cbcdc7c5e89b16e4b") {
    std::cerr << "digest of bytes 0..8\n";
    return 1;
  }
  return 0;
}

int check_homomorphism() {
  const auto data = testutil::pattern(300);
  const tz::digest whole = tz::sum(data);
  const std::span<const std::uint8_t> all{data};
  for (std::size_t cut : {0, 1, 100, 255, 299, 300}) {
    const std::vector<tz::digest> parts{tz::sum(all.first(cut)), tz::sum(all.subspan(cut))};
    if (tz::concat(parts) != whole) {
      std::cerr << "two-way concat at " << cut << "\n";
      return 1;
    }
  }
  const std::vector<tz::digest> three{tz::sum(all.first(100)), tz::sum(all.subspan(100, 100)),
                                      tz::sum(all.subspan(200))};
  if (!tz::validate(whole, three)) {
    std::cerr << "three-way validate\n";
    return 1;
  }

  const std::vector<tz::digest> swapped{tz::sum(bytes("world")), tz::sum(bytes("hello"))};
  if (tz::validate(tz::sum(bytes("helloworld")), swapped)) {
    std::cerr << "order of parts matters\n";
    return 1;
  }
  return 0;
}

int check_streaming_and_clone() {
  tz::TzHasher h;
  h.update(bytes("stream"));
  const auto copy = h.clone();
  h.update(bytes("ing"));
  const auto a = h.sum();
  const auto b = copy->sum();
  const tz::digest want_a = tz::sum(bytes("streaming"));
  const tz::digest want_b = tz::sum(bytes("stream"));
  if (!std::equal(a.begin(), a.end(), want_a.begin())) {
    std::cerr << "incremental updates\n";
    return 1;
  }
  if (!std::equal(b.begin(), b.end(), want_b.begin())) {
    std::cerr << "clone is independent\n";
    return 1;
  }
  if (!(h.size() == 64 && a.size() == 64)) {
    std::cerr << "digest is 64 bytes\n";
    return 1;
  }
  return 0;
}

int check_decode_rejects() {
  tz::digest bad = tz::encode(tz::identity());
  bad[0] = 0x80; // bit 127 is outside the field
  try {
    (void)tz::decode(bad);
    std::cerr << "out-of-field element must be rejected\n";
    return 1;
  } catch (const std::invalid_argument &) {
  }
  const std::vector<std::uint8_t> short_digest(63);
  try {
    (void)tz::decode(short_digest);
    std::cerr << "short digest must be rejected\n";
    return 1;
  } catch (const std::invalid_argument &) {
  }
  return 0;
}

} // namespace

int main() {
  try {
    if (check_field() != 0 || check_empty_is_identity() != 0 || check_known_digests() != 0 ||
        check_homomorphism() != 0 || check_streaming_and_clone() != 0 ||
        check_decode_rejects() != 0) {
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
