#include "file_io.hpp"

#include <filesystem>
#include <limits>
#include <system_error>

#include "block_encoder.hpp"
#include "chunk_combiner.hpp"
#include "errors.hpp"
#include "shared.hpp"

std::ifstream openInputFile(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file.is_open()) throw IoError("Could not open input file: " + filename);
  return file;
}

std::ofstream openOutputFile(const std::string& filename) {
  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) throw IoError("Could not open output file for writing: " + filename);
  return file;
}

uint32_t inputFileSize(const std::string& filename) {
  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(filename, ec);
  if (ec) throw IoError("Could not determine size of " + filename + ": " + ec.message());
  if (size > std::numeric_limits<uint32_t>::max()) {
    throw IoError("Input file " + filename + " is too large for UF2 (" + std::to_string(size) +
                  " bytes)");
  }
  return static_cast<uint32_t>(size);
}

uint32_t generateFile(const GenerateOptions& options, Logger& logger) {
  BlockEncoder encoder(options.page_size, options.family);

  std::ifstream input = openInputFile(options.input);
  uint32_t length = inputFileSize(options.input);

  // reject before the output is created
  encoder.checkLength(length);

  std::ofstream output = openOutputFile(options.output);
  logger.debug("Encoding " + std::to_string(length) + " bytes with page size " +
               std::to_string(encoder.pageSize()) + ", payload " +
               std::to_string(encoder.payloadSize()));

  uint32_t blocks = encoder.encode(input, length, output, [&logger](const UF2Block& block) {
    logger.debug("Block " + std::to_string(block.block_no) + "/" +
                 std::to_string(block.num_blocks) + " addr=" +
                 std::to_string(block.target_addr) + " size=" +
                 std::to_string(block.payload_size));
  });

  output.flush();
  if (!output) throw IoError("Failed to flush output file: " + options.output);

  logger.log("Wrote " + std::to_string(blocks) + " UF2 blocks (" + std::to_string(length) +
             " bytes) to " + options.output);
  return blocks;
}

size_t combineFiles(const CombineOptions& options, Logger& logger) {
  std::ofstream output = openOutputFile(options.output);

  size_t chunks = 0;
  for (const auto& filename : options.inputs) {
    std::ifstream input = openInputFile(filename);
    chunks += combineChunks({{filename, &input}}, output);
    logger.debug("Appended first " + std::to_string(UF2_BLOCK_SIZE) + " bytes of " + filename);
  }

  output.flush();
  if (!output) throw IoError("Failed to flush output file: " + options.output);

  logger.log("Combined " + std::to_string(chunks) + " chunks into " + options.output);
  return chunks;
}
