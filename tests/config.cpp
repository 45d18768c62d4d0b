#include "objsplit/config.hpp"
#include "objsplit/consts.hpp"
#include "objsplit/fs.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static void write_text(const fs::path &p, const std::string &s) {
  objsplit::fs::write_file_atomic(
      p, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

static int run(const fs::path &root) {
  const fs::path cfg_file = root / objsplit::consts::kStoreDir / objsplit::consts::kConfigFile;

  // Missing file -> defaults
  const auto defaults = objsplit::load_config(root);
  if (defaults.max_object_size != objsplit::consts::kDefaultMaxObjectSize ||
      defaults.container != "default" || defaults.owner != "anonymous") {
    std::cerr << "defaults not applied\n";
    return 1;
  }

  // Save then load
  objsplit::StoreConfig cfg{.max_object_size = 4096, .container = "photos", .owner = "alice"};
  objsplit::save_config(root, cfg);
  const auto back = objsplit::load_config(root);
  if (back.max_object_size != 4096 || back.container != "photos" || back.owner != "alice") {
    std::cerr << "config did not round-trip\n";
    return 1;
  }

  // Comments, padding and missing keys
  write_text(cfg_file, "# store settings\nmax_object_size:   512  \r\n\nowner:\tbob\n");
  const auto partial = objsplit::load_config(root);
  if (partial.max_object_size != 512 || partial.owner != "bob" || partial.container != "default") {
    std::cerr << "partial config misread\n";
    return 1;
  }

  // Unparsable or zero size is an error
  for (const char *bad : {"max_object_size: lots\n", "max_object_size: 0\n"}) {
    write_text(cfg_file, bad);
    try {
      (void)objsplit::load_config(root);
      std::cerr << "bad size accepted: " << bad;
      return 1;
    } catch (const std::runtime_error &) {
    }
  }
  return 0;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("objsplit_config_test_" + std::to_string(std::random_device{}()));
  int rc = 1;
  try {
    fs::create_directories(root);
    rc = run(root);
  } catch (const std::exception &e) {
    std::cerr << "config test error: " << e.what() << "\n";
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  if (rc == 0) {
    std::cout << "OK\n";
  }
  return rc;
}
