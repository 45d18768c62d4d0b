#include "objsplit/config.hpp"

#include "objsplit/consts.hpp"
#include "objsplit/fs.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::uint64_t parse_size(const std::string &s) {
  std::uint64_t n = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (ec != std::errc{} || ptr != s.data() + s.size() || n == 0) {
    throw std::runtime_error("config: bad max_object_size: '" + s + "'");
  }
  return n;
}

std::filesystem::path cfg_path(const std::filesystem::path &root) {
  return root / objsplit::consts::kStoreDir / objsplit::consts::kConfigFile;
}

} // namespace

namespace objsplit {

auto load_config(const std::filesystem::path &root) -> StoreConfig {
  StoreConfig out{};
  const auto path = cfg_path(root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_max_size = "max_object_size:";
  constexpr std::string_view k_container = "container:";
  constexpr std::string_view k_owner = "owner:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.rfind(k_max_size, 0) == 0) {
      out.max_object_size = parse_size(trim(sv.substr(k_max_size.size())));
    } else if (sv.rfind(k_container, 0) == 0) {
      out.container = trim(sv.substr(k_container.size()));
    } else if (sv.rfind(k_owner, 0) == 0) {
      out.owner = trim(sv.substr(k_owner.size()));
    }
  }
  return out;
}

void save_config(const std::filesystem::path &root, const StoreConfig &cfg) {
  std::ostringstream os;
  os << "max_object_size: " << cfg.max_object_size << '\n'
     << "container: " << cfg.container << '\n'
     << "owner: " << cfg.owner << '\n';

  const auto path = cfg_path(root);
  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(path, std::span(data, s.size()));
}

} // namespace objsplit
