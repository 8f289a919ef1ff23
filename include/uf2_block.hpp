#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>

#include "shared.hpp"

// Value of the file size slot when it carries the source length
struct TotalSize {
  uint32_t bytes;
};

// Value of the file size slot when it carries a device family tag
struct FamilyId {
  uint32_t id;
};

using SizeOrFamily = std::variant<TotalSize, FamilyId>;

/**
 * One 512 byte UF2 frame
 * The encoder keeps a single instance per stream and rewrites the
 * per-block fields before serializing each frame
 */
struct UF2Block {
  static constexpr uint32_t MAGIC_START_0 = 0x0A324655;
  static constexpr uint32_t MAGIC_START_1 = 0x9E5D5157;
  static constexpr uint32_t MAGIC_END = 0x0AB16F30;
  static constexpr uint32_t FAMILY_ID_PRESENT = 0x00002000;

  uint32_t flags = 0;
  uint32_t target_addr = 0;   // offset of the payload in the device address space
  uint32_t payload_size = 0;  // valid bytes in data
  uint32_t block_no = 0;      // zero based, sequential
  uint32_t num_blocks = 0;    // same value in every block of a stream
  SizeOrFamily size_or_family = TotalSize{0};
  std::array<uint8_t, UF2_MAX_PAYLOAD_SIZE> data{};

  UF2Block() = default;
  UF2Block(uint32_t payload_size, uint32_t num_blocks, uint32_t file_size);

  // Tag every frame with a family id; replaces the file size
  void setFamily(uint32_t family);
  bool hasFamily() const { return (flags & FAMILY_ID_PRESENT) != 0; }

  // Raw value for the file size / family id slot at offset 28
  uint32_t sizeOrFamilyWord() const;

  // Serialize into buffer as a little endian frame, returns UF2_BLOCK_SIZE
  size_t serialize(char* buffer, size_t buffer_size) const;

  std::array<char, UF2_BLOCK_SIZE> toFrame() const;

  // Read the fields of a frame back, magic numbers are not checked
  static UF2Block deserialize(const char* buffer, size_t buffer_size);
};
