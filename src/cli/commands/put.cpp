#include "cli/workspace.hpp"
#include "objsplit/config.hpp"
#include "objsplit/error.hpp"
#include "objsplit/hash.hpp"
#include "objsplit/splitter.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBuf = 64 * 1024;

// "key=value" -> attribute; false if there is no '=' or the key is empty.
bool parse_attribute(const std::string &arg, objsplit::Attribute &out) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  out.key = arg.substr(0, eq);
  out.value = arg.substr(eq + 1);
  return true;
}

} // namespace

int cmd_put(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: objsplit put <file> [key=value ...]\n";
    return 2;
  }
  const fs::path file = argv[1];

  objsplit::ObjectHeader hdr;
  hdr.attributes.push_back(
      objsplit::Attribute{.key = "FileName", .value = file.filename().string()});
  for (int i = 2; i < argc; ++i) {
    objsplit::Attribute attr;
    if (!parse_attribute(argv[i], attr)) {
      std::cerr << "put: bad attribute (want key=value): " << argv[i] << "\n";
      return 2;
    }
    hdr.attributes.push_back(std::move(attr));
  }

  try {
    const auto store = objsplit::cli::open_store();
    const auto cfg = objsplit::load_config(fs::current_path());
    hdr.container_id = cfg.container;
    hdr.owner_id = cfg.owner;

    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
      std::cerr << "put: cannot open " << file << "\n";
      return 1;
    }

    objsplit::PayloadSizeLimiter limiter{cfg.max_object_size, store.target_initializer()};
    limiter.write_header(hdr);

    std::vector<char> buf(kReadBuf);
    while (ifs) {
      ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto n = static_cast<std::size_t>(ifs.gcount());
      if (n == 0) {
        break;
      }
      limiter.write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()), n));
    }
    if (ifs.bad()) {
      std::cerr << "put: read failed: " << file << "\n";
      return 1;
    }

    const auto ids = limiter.close();
    std::cout << objsplit::to_hex(ids.self) << "\n";
    return 0;
  } catch (const objsplit::SplitError &e) {
    std::cerr << "put: " << objsplit::to_string(e.phase()) << " failed after " << e.committed()
              << " stored chunk(s): " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "put: " << e.what() << "\n";
    return 1;
  }
}
