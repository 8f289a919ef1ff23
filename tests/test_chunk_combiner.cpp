#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "chunk_combiner.hpp"
#include "errors.hpp"
#include "shared.hpp"

TEST_CASE("Three chunks are concatenated in order") {
  std::istringstream a(std::string(512, 'a')), b(std::string(512, 'b')), c(std::string(512, 'c'));
  std::ostringstream out;

  size_t written = combineChunks({{"a", &a}, {"b", &b}, {"c", &c}}, out);

  REQUIRE(written == 3);
  REQUIRE(out.str() == std::string(512, 'a') + std::string(512, 'b') + std::string(512, 'c'));
}

TEST_CASE("Only the first chunk of a longer input is taken") {
  std::string long_input = std::string(512, 'x') + std::string(100, 'y');
  std::istringstream in(long_input);
  std::ostringstream out;

  REQUIRE(combineChunks({{"long", &in}}, out) == 1);
  REQUIRE(out.str() == std::string(512, 'x'));
}

TEST_CASE("Input shorter than one chunk is a short read") {
  std::istringstream good(std::string(512, 'g')), bad(std::string(511, 'b'));
  std::ostringstream out;

  REQUIRE_THROWS_AS(combineChunks({{"good", &good}, {"bad", &bad}}, out), ShortRead);
}

TEST_CASE("Short read is reported as an IO error") {
  std::istringstream empty;
  std::ostringstream out;

  REQUIRE_THROWS_AS(combineChunks({{"empty", &empty}}, out), IoError);
}

TEST_CASE("No inputs produce no output") {
  std::ostringstream out;

  REQUIRE(combineChunks({}, out) == 0);
  REQUIRE(out.str().empty());
}
