#include "collectors/raw_sample_sink.hpp"

#include "core/fs_utils.hpp"

namespace framescope::collectors {

bool RawSampleSink::Open(const std::filesystem::path& path, std::string& error) {
  if (!core::EnsureParentDirectory(path, error)) {
    return false;
  }

  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_) {
    error = "failed to open raw sample file '" + path.string() + "' for writing";
    return false;
  }
  path_ = path;
  bytes_written_ = 0U;
  return true;
}

bool RawSampleSink::Append(std::string_view text, std::string& error) {
  if (!out_.is_open()) {
    error = "raw sample file is not open";
    return false;
  }

  out_.write(text.data(), static_cast<std::streamsize>(text.size()));
  out_.flush();
  if (!out_) {
    error = "failed while appending to raw sample file '" + path_.string() + "'";
    return false;
  }
  bytes_written_ += text.size();
  return true;
}

void RawSampleSink::Close() {
  if (out_.is_open()) {
    out_.close();
  }
}

const std::filesystem::path& RawSampleSink::path() const {
  return path_;
}

std::uint64_t RawSampleSink::bytes_written() const {
  return bytes_written_;
}

} // namespace framescope::collectors
