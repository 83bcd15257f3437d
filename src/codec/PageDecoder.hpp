#pragma once

#include "catalog/ColumnDescriptor.hpp"
#include "common/Status.hpp"
#include "type/WireTypes.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Pancake {

// One read response for a single column.
struct RawColumnPage {
  std::string data_;
  // empty when the column is exhausted
  std::string continuation_token_;
  // rows of the column written before it existed, reported again on every
  // response; the last response's count is the one that applies
  uint32_t implicit_nulls_count_{0};
};

// Decodes column pages of the form
//
//   page   := header value*          (an empty buffer holds no values)
//   header := u8 version | u8 dtype tag | u8 nested list depth
//   value  := 0x00 | 0x01 item(0)    (null row | present row)
//   item(d):= u32 count item(d+1)*   while d < nested list depth
//           | atom                   at the nested list depth
//
// All integers are big endian. Atoms are i64 for INT64, f32/f64 for the
// floats, one 0/1 byte for BOOL, u32 length + bytes for STRING and BYTES and
// i64 microseconds since the epoch for TIMESTAMP_MICROS.
//
// Decoding is pure, so a page that fails once fails every time.
class PageDecoder {
public:
  explicit PageDecoder(ColumnDescriptor column) : column_(std::move(column)) {}

  // Appends one value per row of a single-page column, implicit nulls
  // first. values is left untouched on error.
  Status Decode(const RawColumnPage &page,
                std::vector<FieldValue> &values) const {
    return Decode(page.data_, page.implicit_nulls_count_, values);
  }

  Status Decode(std::string_view data, uint32_t implicit_nulls_count,
                std::vector<FieldValue> &values) const;

  const ColumnDescriptor &GetColumn() const { return column_; }

private:
  class Reader;

  Status CheckHeader(Reader &reader) const;

  Status DecodeItem(Reader &reader, uint32_t depth, FieldValue *value) const;

  Status DecodeAtom(Reader &reader, FieldValue *value) const;

  ColumnDescriptor column_;
};
} // namespace Pancake
