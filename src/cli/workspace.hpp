#pragma once
#include "objsplit/object.hpp"
#include "objsplit/object_store.hpp"

#include <filesystem>
#include <string_view>

namespace objsplit::cli {

// .objsplit under the current directory
std::filesystem::path store_dir();

// Throws if the current directory holds no store.
ObjectStore open_store();

// Throws std::invalid_argument on a malformed id.
object_id id_arg(std::string_view hex);

} // namespace objsplit::cli
