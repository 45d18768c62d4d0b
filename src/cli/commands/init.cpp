#include "cli/workspace.hpp"
#include "objsplit/config.hpp"
#include "objsplit/consts.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

int cmd_init(int argc, char **argv) {
  if (argc > 2) {
    std::cerr << "usage: objsplit init [max_object_size]\n";
    return 2;
  }

  objsplit::StoreConfig cfg{};
  if (argc == 2) {
    const std::string_view arg = argv[1];
    std::uint64_t n = 0;
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), n);
    if (ec != std::errc{} || ptr != arg.data() + arg.size() || n == 0) {
      std::cerr << "init: max_object_size must be a positive integer\n";
      return 2;
    }
    cfg.max_object_size = n;
  }

  try {
    const auto dir = objsplit::cli::store_dir();
    if (std::filesystem::exists(dir)) {
      std::cerr << "init: a store already exists at " << dir << "\n";
      return 1;
    }
    std::filesystem::create_directories(dir / objsplit::consts::kObjectsDir);
    objsplit::save_config(std::filesystem::current_path(), cfg);
    std::cout << "Initialized empty objsplit store in " << dir
              << " (max object size " << cfg.max_object_size << ")\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
