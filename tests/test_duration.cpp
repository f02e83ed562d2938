#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

using namespace gnav;
using namespace std::chrono;

TEST_CASE("parse_timeout supports combined units") {
  CHECK(parse_timeout("1m30s") == milliseconds{90000});
  CHECK(parse_timeout("1500ms") == milliseconds{1500});
  CHECK(parse_timeout("2s250ms") == milliseconds{2250});
  CHECK(parse_timeout("1h") == milliseconds{3600000});
  CHECK(parse_timeout("10") == milliseconds{10000});
  CHECK(parse_timeout("") == milliseconds{0});
}

TEST_CASE("parse_timeout rejects invalid strings") {
  CHECK_THROWS_AS(parse_timeout("1m30"), std::invalid_argument);
  CHECK_THROWS_AS(parse_timeout("abc"), std::invalid_argument);
  CHECK_THROWS_AS(parse_timeout("1.5s"), std::invalid_argument);
  CHECK_THROWS_AS(parse_timeout("5d"), std::invalid_argument);
  CHECK_THROWS_AS(parse_timeout("-3s"), std::invalid_argument);
}
