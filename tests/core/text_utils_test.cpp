#include "core/text_utils.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

TEST_CASE("ReadNormalizedLine accepts LF, CRLF and bare CR terminators", "[core][text]") {
  std::istringstream input("one\ntwo\r\nthree\rfour");
  std::vector<std::string> lines;
  std::string line;
  while (framescope::core::ReadNormalizedLine(input, line)) {
    lines.push_back(line);
  }

  REQUIRE(lines == std::vector<std::string>{"one", "two", "three", "four"});
}

TEST_CASE("SplitCommas keeps the empty trailing field", "[core][text]") {
  const auto fields = framescope::core::SplitCommas("A,B,C,");
  REQUIRE(fields.size() == 4U);
  REQUIRE(fields[0] == "A");
  REQUIRE(fields[2] == "C");
  REQUIRE(fields[3].empty());
}

TEST_CASE("SplitWhitespace ignores runs of blanks and tabs", "[core][text]") {
  const auto tokens = framescope::core::SplitWhitespace("  10\t20   30 ");
  REQUIRE(tokens.size() == 3U);
  REQUIRE(tokens[0] == "10");
  REQUIRE(tokens[1] == "20");
  REQUIRE(tokens[2] == "30");
}

TEST_CASE("ParseInt64 accepts signed integers and rejects junk", "[core][text]") {
  std::int64_t value = 0;
  REQUIRE(framescope::core::ParseInt64(" 9223372036854775807 ", value));
  REQUIRE(value == INT64_MAX);
  REQUIRE(framescope::core::ParseInt64("-42", value));
  REQUIRE(value == -42);
  REQUIRE(framescope::core::ParseInt64("+7", value));
  REQUIRE(value == 7);

  REQUIRE_FALSE(framescope::core::ParseInt64("", value));
  REQUIRE_FALSE(framescope::core::ParseInt64("12ab", value));
  REQUIRE_FALSE(framescope::core::ParseInt64("9223372036854775808", value));
}
