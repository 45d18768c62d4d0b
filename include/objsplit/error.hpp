#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace objsplit {

// Which splitter operation a sink failure happened in.
enum class SplitPhase {
  chunk_write,     // streaming payload bytes into the open chunk
  chunk_release,   // flushing header and closing a finished chunk
  parent_release,  // flushing the parent object
  linking_release, // flushing the linking object
};

std::string_view to_string(SplitPhase phase);

/**
 * Sink failure surfaced by the splitter.
 * committed() is the number of chunks already stored when it happened.
 */
class SplitError : public std::runtime_error {
public:
  SplitError(SplitPhase phase, std::size_t committed, const std::string &what)
    : std::runtime_error(what), phase_(phase), committed_(committed) {}

  [[nodiscard]] SplitPhase phase() const noexcept { return phase_; }
  [[nodiscard]] std::size_t committed() const noexcept { return committed_; }

private:
  SplitPhase phase_;
  std::size_t committed_;
};

// A hash produced a digest of the wrong length. Broken wiring, never bad data.
class ChecksumLengthError : public std::logic_error {
public:
  ChecksumLengthError(std::size_t expected, std::size_t actual);

  [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
  [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

private:
  std::size_t expected_;
  std::size_t actual_;
};

} // namespace objsplit
