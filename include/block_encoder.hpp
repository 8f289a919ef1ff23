#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>

#include "uf2_block.hpp"

/**
 * Turns a raw image into a sequence of UF2 frames
 * Payloads are the largest multiple of the device page size that fits
 * in a frame, so no page is ever split across two blocks
 */
class BlockEncoder {
 public:
  // Called after each frame is written
  using BlockCallback = std::function<void(const UF2Block&)>;

  // page_size above UF2_MAX_PAYLOAD_SIZE falls back to 1, zero is rejected
  explicit BlockEncoder(uint32_t page_size, std::optional<uint32_t> family = std::nullopt);

  uint32_t pageSize() const { return page_size_; }
  uint32_t payloadSize() const { return payload_size_; }
  std::optional<uint32_t> family() const { return family_; }

  // Throws IncompatibleLength unless length is a whole number of pages
  void checkLength(uint32_t length) const;

  uint32_t numBlocks(uint32_t length) const;

  // Reads length bytes from in and writes the frames to out
  // Returns the number of frames written
  uint32_t encode(std::istream& in, uint32_t length, std::ostream& out,
                  const BlockCallback& on_block = nullptr) const;

 private:
  uint32_t page_size_;
  uint32_t payload_size_;
  std::optional<uint32_t> family_;
};
