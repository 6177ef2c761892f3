#include "frames/frame_table.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace framescope::frames {

namespace {

std::string DescribeHeader(const std::vector<std::string>& header) {
  return "[" + core::JoinStrings(header, ", ") + "]";
}

} // namespace

FrameTable::FrameTable(std::vector<std::string> header) : header_(std::move(header)) {}

const std::vector<std::string>& FrameTable::header() const {
  return header_;
}

void FrameTable::SetHeader(std::vector<std::string> header) {
  header_ = std::move(header);
  rows_.clear();
}

bool FrameTable::Append(FrameRow row, std::string& error) {
  if (row.size() != header_.size()) {
    error = "frame has " + std::to_string(row.size()) + " values but header has " +
            std::to_string(header_.size()) + " columns";
    return false;
  }
  rows_.push_back(std::move(row));
  return true;
}

const std::vector<FrameRow>& FrameTable::rows() const {
  return rows_;
}

std::size_t FrameTable::size() const {
  return rows_.size();
}

bool FrameTable::empty() const {
  return rows_.empty();
}

bool FrameTable::ResolveColumns(const std::vector<std::string>& columns,
                                std::vector<std::size_t>& indexes, std::string& error) const {
  indexes.clear();
  indexes.reserve(columns.size());
  for (const auto& column : columns) {
    const auto it = std::find(header_.begin(), header_.end(), column);
    if (it == header_.end()) {
      error = "invalid column \"" + column + "\"; must be in " + DescribeHeader(header_);
      return false;
    }
    indexes.push_back(static_cast<std::size_t>(std::distance(header_.begin(), it)));
  }
  return true;
}

bool FrameTable::RenderCsv(const std::optional<std::vector<std::string>>& columns,
                           std::string& csv, std::string& error) const {
  std::vector<std::size_t> indexes;
  std::vector<std::string> out_header;
  if (columns.has_value()) {
    if (!ResolveColumns(*columns, indexes, error)) {
      return false;
    }
    out_header = *columns;
  } else {
    indexes.resize(header_.size());
    for (std::size_t i = 0; i < header_.size(); ++i) {
      indexes[i] = i;
    }
    out_header = header_;
  }

  std::ostringstream out;
  if (!out_header.empty()) {
    out << core::JoinStrings(out_header, ",") << '\n';
  }
  for (const auto& row : rows_) {
    for (std::size_t i = 0; i < indexes.size(); ++i) {
      if (i > 0) {
        out << ',';
      }
      out << row[indexes[i]];
    }
    out << '\n';
  }

  csv = out.str();
  return true;
}

bool FrameTable::Write(const std::filesystem::path& outfile,
                       const std::optional<std::vector<std::string>>& columns,
                       std::string& error) const {
  std::string csv;
  if (!RenderCsv(columns, csv, error)) {
    return false;
  }
  return core::WriteTextFileAtomic(outfile, csv, error);
}

} // namespace framescope::frames
