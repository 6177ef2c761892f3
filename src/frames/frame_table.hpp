#pragma once

#include "frames/frame_types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace framescope::frames {

// In-memory frame time-series for one collection session.
//
// Contract:
// - rows keep arrival order
// - every stored row has exactly header().size() values
// - the whole table is held in memory; SetHeader() drops the rows
class FrameTable {
public:
  FrameTable() = default;
  explicit FrameTable(std::vector<std::string> header);

  const std::vector<std::string>& header() const;
  void SetHeader(std::vector<std::string> header);

  // Rejects rows whose arity differs from the header.
  bool Append(FrameRow row, std::string& error);

  const std::vector<FrameRow>& rows() const;
  std::size_t size() const;
  bool empty() const;

  // Resolves `columns` to header indexes in the requested order. Fails on the
  // first name that is not part of the header.
  bool ResolveColumns(const std::vector<std::string>& columns, std::vector<std::size_t>& indexes,
                      std::string& error) const;

  // Renders CSV text: header line, then one line per row, `\n` terminated.
  // No `columns` means every column in header order.
  bool RenderCsv(const std::optional<std::vector<std::string>>& columns, std::string& csv,
                 std::string& error) const;

  // Writes RenderCsv() output to `outfile`, creating parent directories.
  bool Write(const std::filesystem::path& outfile,
             const std::optional<std::vector<std::string>>& columns, std::string& error) const;

private:
  std::vector<std::string> header_;
  std::vector<FrameRow> rows_;
};

} // namespace framescope::frames
