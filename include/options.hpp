#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct GenerateOptions {
  std::string input;
  std::string output;
  uint32_t page_size = 1;
  std::optional<uint32_t> family;
};

struct CombineOptions {
  std::string output;
  std::vector<std::string> inputs;
};
