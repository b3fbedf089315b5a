#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace mw;

TEST_CASE("toLowerAscii lowers only ASCII letters", "[StringUtils]") {
  REQUIRE(toLowerAscii("/PiNg 42") == "/ping 42");
  REQUIRE(toLowerAscii("") == "");
  // Multi-byte UTF-8 passes through untouched
  REQUIRE(toLowerAscii("\xD0\x9F\xD0\xB8") == "\xD0\x9F\xD0\xB8");
}

TEST_CASE("currentTimeMillis is wall clock milliseconds", "[StringUtils]") {
  int64_t now = currentTimeMillis();
  // After 2020-01-01 and not in seconds
  REQUIRE(now > 1577836800000LL);
}
