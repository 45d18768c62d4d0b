// In-memory ObjectTarget for splitter tests: records every object it is
// handed, assigns sequential ids on close, and can fail on demand.
#pragma once
#include "objsplit/object.hpp"
#include "objsplit/target.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace testutil {

struct Recorded {
  objsplit::ObjectHeader header;
  std::vector<std::uint8_t> payload;
  int header_calls = 0;
  bool closed = false;
  objsplit::object_id id{};
};

struct Failure {
  enum class Step { header, write, close };
  std::size_t object_index; // creation order, 0-based
  Step step;
};

struct Sink {
  std::vector<std::shared_ptr<Recorded>> created; // creation order
  std::vector<std::shared_ptr<Recorded>> closed;  // close order
  std::uint64_t next_id = 1;
  std::optional<Failure> fail;

  objsplit::TargetInitializer initializer();

  [[nodiscard]] bool should_fail(const Recorded &r, Failure::Step step) const {
    if (!fail || fail->step != step) {
      return false;
    }
    return fail->object_index < created.size() && created[fail->object_index].get() == &r;
  }
};

class RecordingTarget final : public objsplit::ObjectTarget {
public:
  RecordingTarget(Sink &sink, std::shared_ptr<Recorded> rec) : sink_(sink), rec_(std::move(rec)) {}

  void write_header(const objsplit::ObjectHeader &hdr) override {
    if (sink_.should_fail(*rec_, Failure::Step::header)) {
      throw std::runtime_error("injected header failure");
    }
    rec_->header = hdr;
    ++rec_->header_calls;
  }

  std::size_t write(std::span<const std::uint8_t> data) override {
    if (sink_.should_fail(*rec_, Failure::Step::write)) {
      throw std::runtime_error("injected write failure");
    }
    rec_->payload.insert(rec_->payload.end(), data.begin(), data.end());
    return data.size();
  }

  objsplit::AccessIdentifiers close() override {
    if (sink_.should_fail(*rec_, Failure::Step::close)) {
      throw std::runtime_error("injected close failure");
    }
    objsplit::object_id id{};
    id.fill(0xAB);
    std::uint64_t n = sink_.next_id++;
    for (int i = 7; i >= 0; --i) {
      id[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(n & 0xFF);
      n >>= 8;
    }
    rec_->id = id;
    rec_->closed = true;
    sink_.closed.push_back(rec_);
    return objsplit::AccessIdentifiers{.self = id, .parent = rec_->header.parent};
  }

private:
  Sink &sink_;
  std::shared_ptr<Recorded> rec_;
};

inline objsplit::TargetInitializer Sink::initializer() {
  return [this]() -> std::unique_ptr<objsplit::ObjectTarget> {
    auto rec = std::make_shared<Recorded>();
    created.push_back(rec);
    return std::make_unique<RecordingTarget>(*this, rec);
  };
}

inline std::vector<std::uint8_t> pattern(std::size_t n) {
  std::vector<std::uint8_t> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
  }
  return out;
}

inline objsplit::ObjectHeader sample_header() {
  objsplit::ObjectHeader hdr;
  hdr.container_id = "container-1";
  hdr.owner_id = "owner-1";
  hdr.attributes = {{.key = "FileName", .value = "a.bin"}, {.key = "Kind", .value = "test"}};
  return hdr;
}

} // namespace testutil
