#include "objsplit/error.hpp"
#include "objsplit/splitter.hpp"
#include "recording_target.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using objsplit::PayloadSizeLimiter;
using objsplit::SplitError;
using objsplit::SplitPhase;
using testutil::Failure;
using testutil::Sink;

namespace {

template <typename E, typename Fn> bool throws(Fn &&fn) {
  try {
    fn();
  } catch (const E &) {
    return true;
  } catch (const std::exception &) {
    return false;
  }
  return false;
}

int check_configuration() {
  Sink sink;
  if (!throws<std::invalid_argument>([&] { PayloadSizeLimiter l(0, sink.initializer()); })) {
    std::cerr << "zero max size must be rejected\n";
    return 1;
  }
  if (!throws<std::invalid_argument>(
          [&] { PayloadSizeLimiter l(100, objsplit::TargetInitializer{}); })) {
    std::cerr << "missing initializer must be rejected\n";
    return 1;
  }
  return 0;
}

int check_sequencing() {
  Sink sink;
  const auto data = testutil::pattern(10);
  {
    PayloadSizeLimiter l(100, sink.initializer());
    if (!throws<std::logic_error>([&] { l.write(data); })) {
      std::cerr << "write before header\n";
      return 1;
    }
    if (!throws<std::logic_error>([&] { l.close(); })) {
      std::cerr << "close before header\n";
      return 1;
    }
  }
  {
    PayloadSizeLimiter l(100, sink.initializer());
    l.write_header(testutil::sample_header());
    if (!throws<std::logic_error>([&] { l.write_header(testutil::sample_header()); })) {
      std::cerr << "second header\n";
      return 1;
    }
    l.write(data);
    l.close();
    if (!throws<std::logic_error>([&] { l.write(data); })) {
      std::cerr << "write after close\n";
      return 1;
    }
    if (!throws<std::logic_error>([&] { l.close(); })) {
      std::cerr << "close twice\n";
      return 1;
    }
  }
  return 0;
}

// Splits 250 bytes at max 100 (3 chunks, parent #3, linking #4) with one injected failure.
int expect_failure(Failure fail, SplitPhase phase, std::size_t committed, const std::string &needle,
                   bool during_close) {
  Sink sink;
  sink.fail = fail;
  PayloadSizeLimiter l(100, sink.initializer());
  l.write_header(testutil::sample_header());

  const std::string tag = std::string(objsplit::to_string(phase));
  try {
    l.write(testutil::pattern(250));
    if (!during_close) {
      std::cerr << tag << ": write should have failed\n";
      return 1;
    }
    l.close();
    std::cerr << tag << ": close should have failed\n";
    return 1;
  } catch (const SplitError &e) {
    if (e.phase() != phase) {
      std::cerr << tag << ": got phase " << objsplit::to_string(e.phase()) << "\n";
      return 1;
    }
    if (e.committed() != committed) {
      std::cerr << tag << ": committed " << e.committed() << "\n";
      return 1;
    }
    if (std::string(e.what()).find(needle) == std::string::npos) {
      std::cerr << tag << ": message " << e.what() << "\n";
      return 1;
    }
  }
  return 0;
}

int check_sink_failures() {
  using Step = Failure::Step;
  if (expect_failure({.object_index = 0, .step = Step::write}, SplitPhase::chunk_write, 0,
                     "could not write chunk to target", false) != 0)
    return 1;
  if (expect_failure({.object_index = 1, .step = Step::header}, SplitPhase::chunk_release, 1,
                     "could not write header", false) != 0)
    return 1;
  if (expect_failure({.object_index = 0, .step = Step::close}, SplitPhase::chunk_release, 0,
                     "could not close target", false) != 0)
    return 1;
  if (expect_failure({.object_index = 3, .step = Step::close}, SplitPhase::parent_release, 2,
                     "could not close target", true) != 0)
    return 1;
  if (expect_failure({.object_index = 2, .step = Step::header}, SplitPhase::chunk_release, 2,
                     "could not write header", true) != 0)
    return 1;
  if (expect_failure({.object_index = 4, .step = Step::header}, SplitPhase::linking_release, 3,
                     "could not write header", true) != 0)
    return 1;
  return 0;
}

int check_null_target() {
  PayloadSizeLimiter l(100, [] { return std::unique_ptr<objsplit::ObjectTarget>{}; });
  l.write_header(testutil::sample_header());
  try {
    l.write(testutil::pattern(1));
    std::cerr << "a missing target must fail the write\n";
    return 1;
  } catch (const SplitError &e) {
    if (e.phase() != SplitPhase::chunk_write) {
      std::cerr << "null target phase\n";
      return 1;
    }
  }
  return 0;
}

} // namespace

int main() {
  try {
    if (check_configuration() != 0 || check_sequencing() != 0 || check_sink_failures() != 0 ||
        check_null_target() != 0) {
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
