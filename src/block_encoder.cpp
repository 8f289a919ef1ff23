#include "block_encoder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "errors.hpp"

BlockEncoder::BlockEncoder(uint32_t page_size, std::optional<uint32_t> family)
    : page_size_(page_size), payload_size_(0), family_(family) {
  if (page_size_ == 0) throw std::invalid_argument("Page size must be at least 1");
  if (page_size_ > UF2_MAX_PAYLOAD_SIZE) page_size_ = 1;

  payload_size_ = page_size_ * (UF2_MAX_PAYLOAD_SIZE / page_size_);
}

void BlockEncoder::checkLength(uint32_t length) const {
  if (length % page_size_ != 0) {
    throw IncompatibleLength("Cannot write binary of len: " + std::to_string(length) +
                             " to device with page size: " + std::to_string(page_size_));
  }
}

uint32_t BlockEncoder::numBlocks(uint32_t length) const {
  return length / payload_size_ + (length % payload_size_ != 0 ? 1 : 0);
}

uint32_t BlockEncoder::encode(std::istream& in, uint32_t length, std::ostream& out,
                              const BlockCallback& on_block) const {
  checkLength(length);

  UF2Block block(payload_size_, numBlocks(length), length);
  if (family_) block.setFamily(*family_);

  std::array<char, UF2_BLOCK_SIZE> frame{};
  uint32_t remaining = length;
  while (remaining > 0) {
    if (remaining < block.payload_size) {
      block.payload_size = remaining;
      std::fill(block.data.begin() + block.payload_size, block.data.end(), 0);
    }

    if (!in.read(reinterpret_cast<char*>(block.data.data()), block.payload_size)) {
      throw IoError("Short read from input at block " + std::to_string(block.block_no) + " of " +
                    std::to_string(block.num_blocks));
    }

    block.serialize(frame.data(), frame.size());
    if (!out.write(frame.data(), frame.size())) {
      throw IoError("Failed to write block " + std::to_string(block.block_no));
    }
    if (on_block) on_block(block);

    remaining -= block.payload_size;
    block.block_no++;
    block.target_addr += block.payload_size;
  }

  return block.block_no;
}
