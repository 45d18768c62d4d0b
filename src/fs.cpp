#include "objsplit/fs.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <zlib.h>

namespace objsplit::fs {

namespace {

constexpr std::size_t kZChunk = 64 * 1024;

std::string z_error(const char *op, int rc, const z_stream &zs) {
  std::string msg = std::string("zlib ") + op + " failed (" + std::to_string(rc) + ")";
  if (zs.msg) {
    msg += ": ";
    msg += zs.msg;
  }
  return msg;
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary | std::ios::ate);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  const auto end = ifs.tellg();
  if (end < 0) {
    throw std::runtime_error("size query failed: " + p.string());
  }
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(end));
  if (!buf.empty() &&
      !ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
    throw std::runtime_error("short read: " + p.string());
  }
  return buf;
}

// Readers never observe a partially written file.
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw std::runtime_error("rename failed: " + p.string() + ": " + ec.message());
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, std::size_t piece) {
  if (piece == 0 || piece > kZMaxPiece)
    throw std::invalid_argument("zlib: bad input slice size");

  z_stream zs{};
  if (const int rc = deflateInit(&zs, Z_BEST_SPEED); rc != Z_OK)
    throw std::runtime_error(z_error("deflateInit", rc, zs));

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, kZChunk> buf{};
  std::span<const std::uint8_t> rest = data;
  int flush = Z_NO_FLUSH;

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0 && flush != Z_FINISH) {
      const auto head = rest.first(std::min(piece, rest.size()));
      rest = rest.subspan(head.size());
      zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(head.data()));
      zs.avail_in = static_cast<uInt>(head.size());
      // finish only once the last slice is in
      if (rest.empty())
        flush = Z_FINISH;
    }
    zs.next_out = buf.data();
    zs.avail_out = static_cast<uInt>(buf.size());
    rc = deflate(&zs, flush);
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
      const std::string msg = z_error("deflate", rc, zs);
      deflateEnd(&zs);
      throw std::runtime_error(msg);
    }
    out.insert(out.end(), buf.begin(), buf.end() - zs.avail_out);
  }
  deflateEnd(&zs);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data, std::size_t piece) {
  if (piece == 0 || piece > kZMaxPiece)
    throw std::invalid_argument("zlib: bad input slice size");

  z_stream zs{};
  if (const int rc = inflateInit(&zs); rc != Z_OK)
    throw std::runtime_error(z_error("inflateInit", rc, zs));

  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, kZChunk> buf{};
  std::span<const std::uint8_t> rest = data;

  int rc = Z_OK;
  bool starved = true;
  while (rc != Z_STREAM_END) {
    if (starved) {
      if (rest.empty()) {
        inflateEnd(&zs);
        throw std::runtime_error("zlib inflate: truncated stream");
      }
      const auto head = rest.first(std::min(piece, rest.size()));
      rest = rest.subspan(head.size());
      zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(head.data()));
      zs.avail_in = static_cast<uInt>(head.size());
    }
    zs.next_out = buf.data();
    zs.avail_out = static_cast<uInt>(buf.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
      const std::string msg = z_error("inflate", rc, zs);
      inflateEnd(&zs);
      throw std::runtime_error(msg);
    }
    out.insert(out.end(), buf.begin(), buf.end() - zs.avail_out);
    // a full buffer may hide pending output; only room left means input ran dry
    starved = zs.avail_in == 0 && zs.avail_out != 0;
  }
  const bool trailing = zs.avail_in != 0 || !rest.empty();
  inflateEnd(&zs);
  if (trailing)
    throw std::runtime_error("zlib inflate: trailing data after stream end");
  return out;
}

} // namespace objsplit::fs
