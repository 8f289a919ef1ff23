#include "uf2_block.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace {

void putLE32(char* buffer, uint32_t value) {
  buffer[0] = static_cast<char>(value & 0xFF);
  buffer[1] = static_cast<char>((value >> 8) & 0xFF);
  buffer[2] = static_cast<char>((value >> 16) & 0xFF);
  buffer[3] = static_cast<char>((value >> 24) & 0xFF);
}

uint32_t getLE32(const char* buffer) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(buffer);
  return static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
         (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
}

// Offsets of the fields inside a frame
constexpr size_t OFF_MAGIC_START_0 = 0;
constexpr size_t OFF_MAGIC_START_1 = 4;
constexpr size_t OFF_FLAGS = 8;
constexpr size_t OFF_TARGET_ADDR = 12;
constexpr size_t OFF_PAYLOAD_SIZE = 16;
constexpr size_t OFF_BLOCK_NO = 20;
constexpr size_t OFF_NUM_BLOCKS = 24;
constexpr size_t OFF_FILE_SIZE = 28;
constexpr size_t OFF_DATA = 32;
constexpr size_t OFF_MAGIC_END = OFF_DATA + UF2_MAX_PAYLOAD_SIZE;

static_assert(OFF_MAGIC_END + sizeof(uint32_t) == UF2_BLOCK_SIZE, "UF2 frame must be 512 bytes");

}  // namespace

UF2Block::UF2Block(uint32_t payload_size, uint32_t num_blocks, uint32_t file_size)
    : payload_size(payload_size), num_blocks(num_blocks), size_or_family(TotalSize{file_size}) {}

void UF2Block::setFamily(uint32_t family) {
  flags |= FAMILY_ID_PRESENT;
  size_or_family = FamilyId{family};
}

uint32_t UF2Block::sizeOrFamilyWord() const {
  if (const auto* family = std::get_if<FamilyId>(&size_or_family)) return family->id;
  return std::get<TotalSize>(size_or_family).bytes;
}

size_t UF2Block::serialize(char* buffer, size_t buffer_size) const {
  if (buffer_size < UF2_BLOCK_SIZE) throw std::runtime_error("Buffer too small for UF2 block");
  if (payload_size > UF2_MAX_PAYLOAD_SIZE)
    throw std::runtime_error("UF2 payload of " + std::to_string(payload_size) +
                             " bytes exceeds " + std::to_string(UF2_MAX_PAYLOAD_SIZE));

  putLE32(buffer + OFF_MAGIC_START_0, MAGIC_START_0);
  putLE32(buffer + OFF_MAGIC_START_1, MAGIC_START_1);
  putLE32(buffer + OFF_FLAGS, flags);
  putLE32(buffer + OFF_TARGET_ADDR, target_addr);
  putLE32(buffer + OFF_PAYLOAD_SIZE, payload_size);
  putLE32(buffer + OFF_BLOCK_NO, block_no);
  putLE32(buffer + OFF_NUM_BLOCKS, num_blocks);
  putLE32(buffer + OFF_FILE_SIZE, sizeOrFamilyWord());

  // bytes past payload_size go out as zero
  std::memcpy(buffer + OFF_DATA, data.data(), payload_size);
  std::memset(buffer + OFF_DATA + payload_size, 0, UF2_MAX_PAYLOAD_SIZE - payload_size);

  putLE32(buffer + OFF_MAGIC_END, MAGIC_END);

  return UF2_BLOCK_SIZE;
}

std::array<char, UF2_BLOCK_SIZE> UF2Block::toFrame() const {
  std::array<char, UF2_BLOCK_SIZE> frame{};
  serialize(frame.data(), frame.size());
  return frame;
}

UF2Block UF2Block::deserialize(const char* buffer, size_t buffer_size) {
  if (buffer_size < UF2_BLOCK_SIZE) throw std::runtime_error("Buffer too small for UF2 block");

  UF2Block block;
  block.flags = getLE32(buffer + OFF_FLAGS);
  block.target_addr = getLE32(buffer + OFF_TARGET_ADDR);
  block.payload_size = getLE32(buffer + OFF_PAYLOAD_SIZE);
  block.block_no = getLE32(buffer + OFF_BLOCK_NO);
  block.num_blocks = getLE32(buffer + OFF_NUM_BLOCKS);

  uint32_t word = getLE32(buffer + OFF_FILE_SIZE);
  if (block.hasFamily()) {
    block.size_or_family = FamilyId{word};
  } else {
    block.size_or_family = TotalSize{word};
  }

  std::memcpy(block.data.data(), buffer + OFF_DATA, UF2_MAX_PAYLOAD_SIZE);
  return block;
}
