#include "cli/workspace.hpp"

#include "objsplit/consts.hpp"
#include "objsplit/fs.hpp"

#include <stdexcept>
#include <string>

namespace objsplit::cli {

std::filesystem::path store_dir() { return std::filesystem::current_path() / consts::kStoreDir; }

ObjectStore open_store() {
  const auto dir = store_dir();
  if (!fs::exists(dir / consts::kObjectsDir)) {
    throw std::runtime_error("not an objsplit store (run `objsplit init`)");
  }
  return ObjectStore{dir};
}

object_id id_arg(std::string_view hex) {
  object_id id{};
  if (!parse_id(hex, id)) {
    throw std::invalid_argument("bad object id: " + std::string(hex));
  }
  return id;
}

} // namespace objsplit::cli
