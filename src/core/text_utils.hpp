#ifndef FRAMESCOPE_CORE_TEXT_UTILS_HPP_
#define FRAMESCOPE_CORE_TEXT_UTILS_HPP_

#include <cctype>
#include <charconv>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace framescope::core {

inline std::string_view TrimAscii(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }

  return text.substr(begin, end - begin);
}

// Reads one line from `input`, accepting `\n`, `\r\n` and bare `\r` as
// terminators. The terminator is consumed and not stored in `line`.
// Returns false only when the stream was already exhausted.
inline bool ReadNormalizedLine(std::istream& input, std::string& line) {
  line.clear();
  bool consumed_any = false;

  std::istream::int_type next = input.get();
  while (next != std::istream::traits_type::eof()) {
    consumed_any = true;
    const char c = std::istream::traits_type::to_char_type(next);
    if (c == '\n') {
      return true;
    }
    if (c == '\r') {
      if (input.peek() == '\n') {
        input.get();
      }
      return true;
    }
    line.push_back(c);
    next = input.get();
  }

  // Clear eof so callers that keep reading see a clean end-of-input result.
  input.clear(input.rdstate() & ~std::ios::failbit);
  return consumed_any;
}

inline std::vector<std::string_view> SplitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    const std::size_t begin = pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
      ++pos;
    }
    if (pos > begin) {
      tokens.push_back(text.substr(begin, pos - begin));
    }
  }
  return tokens;
}

// Splits on every comma; empty fields are preserved ("a,,b," -> a, "", b, "").
inline std::vector<std::string_view> SplitCommas(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t begin = 0;
  while (true) {
    const std::size_t comma = text.find(',', begin);
    if (comma == std::string_view::npos) {
      fields.push_back(text.substr(begin));
      return fields;
    }
    fields.push_back(text.substr(begin, comma - begin));
    begin = comma + 1;
  }
}

inline bool ParseInt64(std::string_view text, std::int64_t& value) {
  text = TrimAscii(text);
  if (text.empty()) {
    return false;
  }
  // from_chars rejects a leading '+', which some dump sources emit.
  if (text.front() == '+') {
    text.remove_prefix(1);
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  std::int64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

inline std::string JoinStrings(const std::vector<std::string>& parts, std::string_view separator) {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined.append(separator);
    }
    joined.append(parts[i]);
  }
  return joined;
}

} // namespace framescope::core

#endif // FRAMESCOPE_CORE_TEXT_UTILS_HPP_
