#pragma once
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace objsplit::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Largest input slice handed to zlib at once; its avail_in is 32-bit.
inline constexpr std::size_t kZMaxPiece = std::numeric_limits<std::uint32_t>::max();

// Input of any length is fed to zlib in slices of at most `piece` bytes.
std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data,
                                     std::size_t piece = kZMaxPiece);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data,
                                       std::size_t piece = kZMaxPiece);

} // namespace objsplit::fs
