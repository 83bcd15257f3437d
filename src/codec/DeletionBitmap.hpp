#pragma once

#include "common/Config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace Pancake {
// Segment deletion data. Bit i (LSB first within each byte) is set when row i
// has been deleted. Rows past the end of the bitmap are live, so an empty
// bitmap deletes nothing.
class DeletionBitmap {
public:
  DeletionBitmap() = default;
  explicit DeletionBitmap(std::string data) : data_(std::move(data)) {}

  bool IsDeleted(size_t row_idx) const {
    size_t byte_idx = row_idx / 8;
    if (byte_idx >= data_.size()) {
      return false;
    }
    return (static_cast<Byte>(data_[byte_idx]) >> (row_idx % 8)) & 1;
  }

  bool Empty() const { return data_.empty(); }

  size_t DeletedCount(size_t row_count) const {
    size_t n = 0;
    for (size_t i = 0; i < row_count; i++) {
      n += IsDeleted(i);
    }
    return n;
  }

  // Covers every bit of the bitmap, padding bits of the last byte included.
  std::vector<bool> ToVector() const {
    std::vector<bool> is_deleted(data_.size() * 8);
    for (size_t i = 0; i < is_deleted.size(); i++) {
      is_deleted[i] = IsDeleted(i);
    }
    return is_deleted;
  }

private:
  std::string data_;
};
} // namespace Pancake
