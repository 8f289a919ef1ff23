#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Every UF2 frame is exactly this many bytes on the wire
constexpr size_t UF2_BLOCK_SIZE = 512;

// 512 bytes minus 32 bytes of header and 4 bytes of trailing magic
constexpr uint32_t UF2_MAX_PAYLOAD_SIZE = 476;

enum class Command : uint8_t {
  COMBINE,
  GENERATE,
  HELP,
};

class SharedFunctions {
 public:
  static std::string commandToStr(Command command);
};
