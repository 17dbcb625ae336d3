#pragma once
#include "split_source/boundary_policy.hpp"
#include "split_source/line_scanner.hpp"
#include "split_source/source_descriptor.hpp"

#include <cstdint>
#include <memory>

namespace ss {

// Raw-record cursor over one file range. Owns the channel from start() until
// exhaustion, failure or destruction; never restarts.
class RangeCursor {
public:
  // d.mode() must be SingleFile or SubrangeOfSingleFile.
  RangeCursor(SourceDescriptor d, std::shared_ptr<const BoundaryPolicy> policy,
              LineScanner::Config cfg = {});
  ~RangeCursor();

  RangeCursor(const RangeCursor&) = delete;
  RangeCursor& operator=(const RangeCursor&) = delete;

  // Opens the channel, adjusts to the first owned record and reads it.
  bool start();
  // False once the range or the channel is exhausted, and forever after.
  bool advance();

  bool has_current() const noexcept;
  const RawRecord& current() const;       // IllegalStateError without a record
  std::int64_t current_offset() const;    // IllegalStateError without a record
  std::int64_t next_offset() const;       // IllegalStateError without a record
  bool is_at_split_point() const;         // IllegalStateError without a record
  // Offset of the latest split point at or before the current record.
  std::int64_t split_offset() const;      // IllegalStateError without a record

  bool is_done() const noexcept;
  const SourceDescriptor& descriptor() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
