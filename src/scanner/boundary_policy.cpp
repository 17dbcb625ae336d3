#include "split_source/boundary_policy.hpp"
#include "split_source/errors.hpp"

namespace ss {

bool LineBoundary::next_record(LineScanner& s, BoundaryState& st, RawRecord& out) const {
  if (!s.read_next(out)) return false;
  st.at_split_point = true;
  st.split_offset = out.offset;
  return true;
}

HeaderBlockBoundary::HeaderBlockBoundary(std::string marker) : marker_(std::move(marker)) {
  if (marker_.empty()) throw ConfigError("header block marker must not be empty");
}

bool HeaderBlockBoundary::skip_to_first_unit(LineScanner& s, BoundaryState& st,
                                             std::int64_t end_offset) const {
  // Records before the first marker belong to a block begun in an earlier shard.
  // A marker at or past end_offset starts a block owned by a later shard.
  RawRecord rec;
  while (s.read_next(rec)) {
    if (rec.offset >= end_offset) return false;
    if (rec.bytes == marker_) {
      st.pending_split = true;
      st.pending_offset = rec.offset;
      return true;
    }
  }
  return false;
}

bool HeaderBlockBoundary::next_record(LineScanner& s, BoundaryState& st, RawRecord& out) const {
  st.at_split_point = false;
  while (s.read_next(out)) {
    if (out.bytes == marker_) {
      // Empty blocks collapse; the latest marker owns the next data record.
      st.pending_split = true;
      st.pending_offset = out.offset;
      continue;
    }
    if (st.pending_split) {
      st.at_split_point = true;
      st.split_offset = st.pending_offset;
      st.pending_split = false;
    }
    return true;
  }
  return false;
}

}
