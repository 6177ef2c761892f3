#include "parsers/record_filter.hpp"

namespace framescope::parsers {

std::string_view ToString(const RecordVerdict verdict) {
  switch (verdict) {
  case RecordVerdict::kAccepted:
    return "accepted";
  case RecordVerdict::kNullRecord:
    return "null";
  case RecordVerdict::kStale:
    return "stale";
  case RecordVerdict::kImplausible:
    return "implausible";
  case RecordVerdict::kMalformed:
    return "malformed";
  }
  return "malformed";
}

bool FrameWatermark::IsFresh(const std::int64_t key) const {
  return !last_accepted_.has_value() || key > *last_accepted_;
}

void FrameWatermark::Advance(const std::int64_t key) {
  last_accepted_ = key;
}

void FrameWatermark::Reset() {
  last_accepted_.reset();
}

std::optional<std::int64_t> FrameWatermark::value() const {
  return last_accepted_;
}

} // namespace framescope::parsers
