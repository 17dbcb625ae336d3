#include "split_source/range_cursor.hpp"
#include "split_source/channel_provider.hpp"
#include "split_source/errors.hpp"

namespace ss {

namespace {
enum class Phase { Unstarted, Reading, Exhausted, Failed };
}

struct RangeCursor::Impl {
  SourceDescriptor desc;
  std::shared_ptr<const BoundaryPolicy> policy;
  LineScanner::Config cfg;

  Phase phase{Phase::Unstarted};
  std::unique_ptr<LineScanner> scanner;
  BoundaryState st;
  RawRecord rec;
  bool has_current{false};
  std::uint64_t bytes{0};

  Impl(SourceDescriptor d, std::shared_ptr<const BoundaryPolicy> p, LineScanner::Config c)
    : desc(std::move(d)), policy(std::move(p)), cfg(c) {}

  void release() {
    if (!scanner) return;
    bytes = scanner->bytes_read();
    scanner->close();
    scanner.reset();
  }

  bool finish() {
    has_current = false;
    phase = Phase::Exhausted;
    release();
    return false;
  }

  // Channel positioned at start - 1 for sub-ranges past byte 0; the record
  // running through that byte is dropped so the first record returned starts
  // at or after the requested offset.
  void open_and_adjust() {
    auto provider = ChannelRegistry::instance().provider_for(desc.path_or_pattern());
    const std::int64_t start = desc.start_offset();
    const bool back_up = desc.mode() == SourceMode::SubrangeOfSingleFile && start > 0;

    scanner = std::make_unique<LineScanner>(
        provider->open_seekable_for_read(desc.path_or_pattern(), back_up ? start - 1 : start), cfg);
    if (back_up) {
      RawRecord partial;
      (void)scanner->read_next(partial);
    }
  }

  bool read_one() {
    if (!policy->next_record(*scanner, st, rec)) return finish();
    if (st.at_split_point && st.split_offset >= desc.end_offset()) return finish();
    has_current = true;
    return true;
  }

  template <typename F>
  bool guarded(F&& f) {
    try {
      return f();
    } catch (...) {
      has_current = false;
      phase = Phase::Failed;
      release();
      throw;
    }
  }

  void require_current(const char* what) const {
    if (!has_current)
      throw IllegalStateError(std::string(what) + " called without a current record on " +
                              desc.to_string());
  }
};

RangeCursor::RangeCursor(SourceDescriptor d, std::shared_ptr<const BoundaryPolicy> policy,
                         LineScanner::Config cfg) {
  if (d.mode() == SourceMode::WholeFileOrPattern)
    throw InvalidRangeError("range reader needs a single-file descriptor, got " + d.to_string());
  if (!policy) throw ConfigError("range reader needs a boundary policy");
  p_ = new Impl(std::move(d), std::move(policy), cfg);
}

RangeCursor::~RangeCursor() { delete p_; }

bool RangeCursor::start() {
  if (p_->phase != Phase::Unstarted)
    throw IllegalStateError("start() called twice on " + p_->desc.to_string());
  p_->phase = Phase::Reading;
  return p_->guarded([this] {
    p_->open_and_adjust();
    if (!p_->policy->skip_to_first_unit(*p_->scanner, p_->st, p_->desc.end_offset())) return p_->finish();
    return p_->read_one();
  });
}

bool RangeCursor::advance() {
  if (p_->phase == Phase::Unstarted)
    throw IllegalStateError("advance() before start() on " + p_->desc.to_string());
  if (p_->phase != Phase::Reading) return false;
  return p_->guarded([this] { return p_->read_one(); });
}

bool RangeCursor::has_current() const noexcept { return p_->has_current; }

const RawRecord& RangeCursor::current() const {
  p_->require_current("current()");
  return p_->rec;
}

std::int64_t RangeCursor::current_offset() const {
  p_->require_current("current_offset()");
  return p_->rec.offset;
}

std::int64_t RangeCursor::next_offset() const {
  p_->require_current("next_offset()");
  return p_->rec.next_offset;
}

bool RangeCursor::is_at_split_point() const {
  p_->require_current("is_at_split_point()");
  return p_->st.at_split_point;
}

std::int64_t RangeCursor::split_offset() const {
  p_->require_current("split_offset()");
  return p_->st.split_offset;
}

bool RangeCursor::is_done() const noexcept {
  return p_->phase == Phase::Exhausted || p_->phase == Phase::Failed;
}

const SourceDescriptor& RangeCursor::descriptor() const noexcept { return p_->desc; }

std::uint64_t RangeCursor::bytes_read() const noexcept {
  return p_->scanner ? p_->scanner->bytes_read() : p_->bytes;
}

}
