#include "parsers/dump_parser.hpp"

namespace framescope::parsers {

void CountVerdict(const RecordVerdict verdict, ParseStats& stats) {
  switch (verdict) {
  case RecordVerdict::kAccepted:
    ++stats.frames_accepted;
    return;
  case RecordVerdict::kNullRecord:
    ++stats.null_frames;
    return;
  case RecordVerdict::kStale:
    ++stats.stale_frames;
    return;
  case RecordVerdict::kImplausible:
    ++stats.bogus_frames;
    return;
  case RecordVerdict::kMalformed:
    ++stats.malformed_records;
    return;
  }
}

} // namespace framescope::parsers
