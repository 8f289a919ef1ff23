#include "chunk_combiner.hpp"

#include <array>

#include "errors.hpp"
#include "shared.hpp"

size_t combineChunks(const std::vector<NamedInput>& inputs, std::ostream& out) {
  std::array<char, UF2_BLOCK_SIZE> chunk{};
  size_t written = 0;

  for (const auto& [name, in] : inputs) {
    if (!in->read(chunk.data(), chunk.size())) {
      throw ShortRead("Input " + name + " holds only " + std::to_string(in->gcount()) +
                      " of " + std::to_string(UF2_BLOCK_SIZE) + " bytes");
    }
    if (!out.write(chunk.data(), chunk.size())) {
      throw IoError("Failed to write chunk from " + name);
    }
    written++;
  }

  return written;
}
