#pragma once
#include "objsplit/consts.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace objsplit {

struct StoreConfig {
  std::uint64_t max_object_size = consts::kDefaultMaxObjectSize;
  std::string container{consts::kDefaultContainer};
  std::string owner{consts::kDefaultOwner};
};

// Read <root>/.objsplit/config (defaults for missing keys or file)
StoreConfig load_config(const std::filesystem::path& root);

// Overwrite <root>/.objsplit/config with cfg
void save_config(const std::filesystem::path& root, const StoreConfig& cfg);

} // namespace objsplit
