#include <catch2/catch.hpp>

#include <filesystem>
#include <sstream>
#include <string>

#include "block_encoder.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

TEST_CASE("generateFile writes one frame per payload") {
  TempDir dir("uf2tool_test_generate");
  writeFile(dir.file("fw.bin"), std::string(1024, '\x42'));

  std::ostringstream log;
  Logger logger{log};
  GenerateOptions options{dir.file("fw.bin"), dir.file("fw.uf2"), 256, 7};

  REQUIRE(generateFile(options, logger) == 4);

  std::string uf2 = readFile(dir.file("fw.uf2"));
  REQUIRE(uf2.size() == 4 * UF2_BLOCK_SIZE);
  UF2Block last = UF2Block::deserialize(uf2.data() + 3 * UF2_BLOCK_SIZE, UF2_BLOCK_SIZE);
  REQUIRE(last.block_no == 3);
  REQUIRE(last.target_addr == 768);
  REQUIRE(last.sizeOrFamilyWord() == 7);
  REQUIRE(log.str().find("Wrote 4 UF2 blocks") != std::string::npos);
}

TEST_CASE("generateFile leaves no output for an incompatible length") {
  TempDir dir("uf2tool_test_incompatible");
  writeFile(dir.file("fw.bin"), std::string(10, '\x01'));

  std::ostringstream log;
  Logger logger{log};
  GenerateOptions options{dir.file("fw.bin"), dir.file("fw.uf2"), 3, std::nullopt};

  REQUIRE_THROWS_AS(generateFile(options, logger), IncompatibleLength);
  REQUIRE_FALSE(fs::exists(dir.file("fw.uf2")));
}

TEST_CASE("generateFile leaves an existing output unchanged for an incompatible length") {
  TempDir dir("uf2tool_test_incompatible_existing");
  writeFile(dir.file("fw.bin"), std::string(10, '\x01'));
  std::string previous = "previous contents of fw.uf2";
  writeFile(dir.file("fw.uf2"), previous);

  std::ostringstream log;
  Logger logger{log};
  GenerateOptions options{dir.file("fw.bin"), dir.file("fw.uf2"), 3, std::nullopt};

  REQUIRE_THROWS_AS(generateFile(options, logger), IncompatibleLength);
  REQUIRE(readFile(dir.file("fw.uf2")) == previous);
}

TEST_CASE("generateFile on an empty input writes an empty file") {
  TempDir dir("uf2tool_test_empty");
  writeFile(dir.file("fw.bin"), "");

  std::ostringstream log;
  Logger logger{log};
  GenerateOptions options{dir.file("fw.bin"), dir.file("fw.uf2"), 1, std::nullopt};

  REQUIRE(generateFile(options, logger) == 0);
  REQUIRE(fs::exists(dir.file("fw.uf2")));
  REQUIRE(fs::file_size(dir.file("fw.uf2")) == 0);
}

TEST_CASE("Missing input file is an IO error") {
  TempDir dir("uf2tool_test_missing");

  std::ostringstream log;
  Logger logger{log};
  GenerateOptions options{dir.file("nope.bin"), dir.file("fw.uf2"), 1, std::nullopt};

  REQUIRE_THROWS_AS(generateFile(options, logger), IoError);
  REQUIRE_THROWS_AS(inputFileSize(dir.file("nope.bin")), IoError);
}

TEST_CASE("combineFiles concatenates the first frame of each file") {
  TempDir dir("uf2tool_test_combine");
  writeFile(dir.file("0.uf2"), std::string(512, '0'));
  writeFile(dir.file("1.uf2"), std::string(512, '1') + "trailing");
  writeFile(dir.file("2.uf2"), std::string(512, '2'));

  std::ostringstream log;
  Logger logger{log};
  CombineOptions options{dir.file("all.uf2"),
                         {dir.file("0.uf2"), dir.file("1.uf2"), dir.file("2.uf2")}};

  REQUIRE(combineFiles(options, logger) == 3);

  std::string all = readFile(dir.file("all.uf2"));
  REQUIRE(all.size() == 1536);
  REQUIRE(all == std::string(512, '0') + std::string(512, '1') + std::string(512, '2'));
}

TEST_CASE("combineFiles fails on a short input") {
  TempDir dir("uf2tool_test_combine_short");
  writeFile(dir.file("0.uf2"), std::string(100, '0'));

  std::ostringstream log;
  Logger logger{log};
  CombineOptions options{dir.file("all.uf2"), {dir.file("0.uf2")}};

  REQUIRE_THROWS_AS(combineFiles(options, logger), ShortRead);
}

TEST_CASE("Verbose logger reports every block") {
  TempDir dir("uf2tool_test_verbose");
  writeFile(dir.file("fw.bin"), std::string(952, '\x33'));

  std::ostringstream log;
  Logger logger{log, true};
  GenerateOptions options{dir.file("fw.bin"), dir.file("fw.uf2"), 1, std::nullopt};

  REQUIRE(generateFile(options, logger) == 2);
  REQUIRE(log.str().find("debug: Block 0/2 addr=0 size=476") != std::string::npos);
  REQUIRE(log.str().find("debug: Block 1/2 addr=476 size=476") != std::string::npos);
}
