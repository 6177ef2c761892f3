#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace framescope::parsers {

// Outcome of screening one candidate frame record.
enum class RecordVerdict {
  kAccepted = 0,
  // Ordering key is zero: the source had nothing new to report.
  kNullRecord,
  // Ordering key is not past the session watermark (duplicate or out of order).
  kStale,
  // Record failed the variant's plausibility predicate.
  kImplausible,
  // Record could not be decoded at all.
  kMalformed,
};

std::string_view ToString(RecordVerdict verdict);

// Highest accepted ordering key seen so far in one session.
class FrameWatermark {
public:
  // True when `key` lies strictly past the current watermark (or none is set).
  bool IsFresh(std::int64_t key) const;
  void Advance(std::int64_t key);
  void Reset();

  std::optional<std::int64_t> value() const;

private:
  std::optional<std::int64_t> last_accepted_;
};

// Shared screening used by parser variants that deduplicate by an ordering key.
//
// Checks run in a fixed order: null key, watermark, then `is_plausible`. Only
// an accepted record advances the watermark.
template <typename Record, typename KeyFn, typename PlausibleFn>
RecordVerdict ScreenRecord(const Record& record, FrameWatermark& watermark, KeyFn key_of,
                           PlausibleFn is_plausible) {
  const std::int64_t key = key_of(record);
  if (key == 0) {
    return RecordVerdict::kNullRecord;
  }
  if (!watermark.IsFresh(key)) {
    return RecordVerdict::kStale;
  }
  if (!is_plausible(record)) {
    return RecordVerdict::kImplausible;
  }
  watermark.Advance(key);
  return RecordVerdict::kAccepted;
}

} // namespace framescope::parsers
