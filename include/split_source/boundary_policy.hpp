#pragma once
#include "split_source/line_scanner.hpp"

#include <cstdint>
#include <string>

namespace ss {

// Per-reader state threaded through a (stateless, shareable) policy.
struct BoundaryState {
  bool at_split_point = false;
  // Offset a residual shard must start at to begin with the current record.
  std::int64_t split_offset = 0;
  // A block marker was consumed and its first data record is still ahead.
  bool pending_split = false;
  std::int64_t pending_offset = 0;
};

// Record-boundary strategy. The byte-offset adjustment (back up one byte,
// drop one record) is done by the reader for every policy; a policy only adds
// the forward skip to its first owned unit and tags split points.
class BoundaryPolicy {
public:
  virtual ~BoundaryPolicy() = default;

  // Runs once after the byte-offset adjustment. False if no owned unit starts
  // before end_offset.
  virtual bool skip_to_first_unit(LineScanner& s, BoundaryState& st,
                                  std::int64_t end_offset) const = 0;

  // Next data record; sets st.at_split_point and st.split_offset.
  virtual bool next_record(LineScanner& s, BoundaryState& st, RawRecord& out) const = 0;

  virtual std::string name() const = 0;
};

// Every delimited record is a split point.
class LineBoundary final : public BoundaryPolicy {
public:
  bool skip_to_first_unit(LineScanner&, BoundaryState&, std::int64_t) const override { return true; }
  bool next_record(LineScanner& s, BoundaryState& st, RawRecord& out) const override;
  std::string name() const override { return "line"; }
};

// Blocks introduced by a marker record. Markers are never returned; the first
// data record after a marker is the only split point of its block, and its
// split offset is the offset of that marker.
//
//   lines: h, a, b, h, h, c   ->   records a, b, c; a and c are split points
class HeaderBlockBoundary final : public BoundaryPolicy {
public:
  explicit HeaderBlockBoundary(std::string marker);

  bool skip_to_first_unit(LineScanner& s, BoundaryState& st, std::int64_t end_offset) const override;
  bool next_record(LineScanner& s, BoundaryState& st, RawRecord& out) const override;
  std::string name() const override { return "header:" + marker_; }

private:
  std::string marker_;
};

}
