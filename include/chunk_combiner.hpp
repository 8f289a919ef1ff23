#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// An input to combine and the name used when reporting errors about it
using NamedInput = std::pair<std::string, std::istream*>;

// Copies the first UF2_BLOCK_SIZE bytes of every input to out, in order
// Frame contents are not inspected. Returns the number of chunks written
size_t combineChunks(const std::vector<NamedInput>& inputs, std::ostream& out);
