#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace objsplit::consts {

// Directory and file names
inline constexpr std::string_view kStoreDir   = ".objsplit";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kConfigFile = "config";

// ——— Object ID sizes ———
inline constexpr std::size_t kIdRawLen = 32; // 32 bytes (SHA-256)
inline constexpr std::size_t kIdHexLen = 64; // 64 hex chars

// ——— Payload checksum sizes ———
inline constexpr std::size_t kSha256Size = 32; // standard digest
inline constexpr std::size_t kTzSize     = 64; // Tillich-Zemor homomorphic digest

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .objsplit/objects

// ——— Defaults for a fresh store ———
inline constexpr std::uint64_t kDefaultMaxObjectSize = 64ULL * 1024 * 1024;
inline constexpr std::string_view kDefaultContainer  = "default";
inline constexpr std::string_view kDefaultOwner      = "anonymous";

// ——— Header encoding keys ———
inline constexpr std::string_view kKeyContainer   = "container";
inline constexpr std::string_view kKeyOwner       = "owner";
inline constexpr std::string_view kKeyAttribute   = "attr";
inline constexpr std::string_view kKeySize        = "size";
inline constexpr std::string_view kKeyChecksum    = "checksum";
inline constexpr std::string_view kKeyHomomorphic = "homomorphic";
inline constexpr std::string_view kKeyPrevious    = "previous";
inline constexpr std::string_view kKeyParent      = "parent";
inline constexpr std::string_view kKeyChild       = "child";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';
inline constexpr char kEq    = '=';

} // namespace objsplit::consts
