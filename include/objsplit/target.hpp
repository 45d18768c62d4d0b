#pragma once
#include "objsplit/object.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace objsplit {

/**
 * Destination for exactly one physical object.
 *
 * Contract:
 *   write() zero or more times, bytes in order;
 *   write_header() at most once, before close(). The header carries the
 *   payload checksums, so it may arrive after the payload bytes;
 *   close() once, returning the identifiers assigned to the object.
 * Failures are reported by throwing.
 */
class ObjectTarget {
public:
  virtual ~ObjectTarget() = default;

  virtual void write_header(const ObjectHeader &hdr) = 0;
  // Returns the number of bytes consumed.
  virtual std::size_t write(std::span<const std::uint8_t> data) = 0;
  virtual AccessIdentifiers close() = 0;
};

// Produces a fresh target for every physical object.
using TargetInitializer = std::function<std::unique_ptr<ObjectTarget>()>;

} // namespace objsplit
