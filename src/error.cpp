#include "objsplit/error.hpp"

#include <string>

namespace objsplit {

std::string_view to_string(SplitPhase phase) {
  switch (phase) {
  case SplitPhase::chunk_write:
    return "chunk write";
  case SplitPhase::chunk_release:
    return "chunk release";
  case SplitPhase::parent_release:
    return "parent release";
  case SplitPhase::linking_release:
    return "linking release";
  }
  return "unknown";
}

ChecksumLengthError::ChecksumLengthError(std::size_t expected, std::size_t actual)
  : std::logic_error("wrong checksum length: expected " + std::to_string(expected) + ", has " +
                     std::to_string(actual)),
    expected_(expected), actual_(actual) {}

} // namespace objsplit
