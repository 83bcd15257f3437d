#include "codec/PageDecoder.hpp"
#include "common/Config.hpp"
#include "common/util/ByteUtil.hpp"
#include "common/util/StringUtil.hpp"

#include "fmt/format.h"

#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <iterator>

namespace Pancake {

class PageDecoder::Reader {
public:
  explicit Reader(std::string_view data)
      : data_(reinterpret_cast<const Byte *>(data.data())), size_(data.size()) {}

  bool Done() const { return offset_ == size_; }

  size_t Offset() const { return offset_; }

  size_t Remaining() const { return size_ - offset_; }

  Status Take(size_t n, const Byte *&p, std::string_view what) {
    if (Remaining() < n) {
      return Status::Error(
          ErrorCode::DecodeError,
          fmt::format("page truncated reading {} at offset {}: need {} bytes, "
                      "{} left",
                      what, offset_, n, Remaining()));
    }
    p = data_ + offset_;
    offset_ += n;
    return Status::OK();
  }

  Status ReadByte(uint8_t &b, std::string_view what) {
    const Byte *p;
    auto status = Take(1, p, what);
    if (!status.ok()) {
      return status;
    }
    b = *p;
    return Status::OK();
  }

  Status ReadUint32(uint32_t &n, std::string_view what) {
    const Byte *p;
    auto status = Take(4, p, what);
    if (!status.ok()) {
      return status;
    }
    n = ByteUtil::LoadBigEndian<uint32_t>(p);
    return Status::OK();
  }

private:
  const Byte *data_;
  size_t size_;
  size_t offset_{0};
};

Status PageDecoder::Decode(std::string_view data,
                           uint32_t implicit_nulls_count,
                           std::vector<FieldValue> &values) const {
  std::vector<FieldValue> decoded(implicit_nulls_count);
  if (!data.empty()) {
    Reader reader(data);
    auto status = CheckHeader(reader);
    if (!status.ok()) {
      return status;
    }
    while (!reader.Done()) {
      size_t row_offset = reader.Offset();
      uint8_t marker;
      status = reader.ReadByte(marker, "row marker");
      if (!status.ok()) {
        return status;
      }
      if (marker == NULL_MARKER) {
        decoded.emplace_back();
        continue;
      }
      if (marker != PRESENT_MARKER) {
        return Status::Error(
            ErrorCode::DecodeError,
            fmt::format("unknown row marker {:#04x} at offset {} of column {}",
                        marker, row_offset, column_.name_));
      }
      status = DecodeItem(reader, 0, &decoded.emplace_back());
      if (!status.ok()) {
        return status;
      }
    }
  }

  values.reserve(values.size() + decoded.size());
  std::move(decoded.begin(), decoded.end(), std::back_inserter(values));
  return Status::OK();
}

Status PageDecoder::CheckHeader(Reader &reader) const {
  const Byte *header;
  auto status = reader.Take(PAGE_HEADER_SIZE, header, "page header");
  if (!status.ok()) {
    return status;
  }
  if (header[0] != PAGE_FORMAT_VERSION) {
    return Status::Error(ErrorCode::DecodeError,
                         fmt::format("unsupported page format version {}",
                                     static_cast<int>(header[0])));
  }
  if (!idl::DataType_IsValid(header[1])) {
    return Status::Error(ErrorCode::DecodeError,
                         fmt::format("unknown dtype tag {} in page header",
                                     static_cast<int>(header[1])));
  }
  auto dtype = static_cast<DataType>(header[1]);
  if (dtype != column_.dtype_) {
    return Status::Error(
        ErrorCode::TypeMismatchError,
        fmt::format("column {} is declared {} but the page encodes {}",
                    column_.name_, idl::DataType_Name(column_.dtype_),
                    idl::DataType_Name(dtype)));
  }
  if (header[2] != column_.nested_list_depth_) {
    return Status::Error(
        ErrorCode::TypeMismatchError,
        fmt::format("column {} is declared with nested list depth {} but the "
                    "page encodes depth {}",
                    column_.name_, column_.nested_list_depth_,
                    static_cast<int>(header[2])));
  }
  return Status::OK();
}

Status PageDecoder::DecodeItem(Reader &reader, uint32_t depth,
                               FieldValue *value) const {
  if (depth == column_.nested_list_depth_) {
    return DecodeAtom(reader, value);
  }

  uint32_t count;
  auto status = reader.ReadUint32(count, "list length");
  if (!status.ok()) {
    return status;
  }
  // every element takes at least one byte
  if (count > reader.Remaining()) {
    return Status::Error(
        ErrorCode::DecodeError,
        fmt::format("list of {} elements at offset {} exceeds the {} bytes "
                    "left in the page",
                    count, reader.Offset(), reader.Remaining()));
  }
  auto *list = value->mutable_list_val();
  list->mutable_vals()->Reserve(static_cast<int>(count));
  for (uint32_t i = 0; i < count; i++) {
    status = DecodeItem(reader, depth + 1, list->add_vals());
    if (!status.ok()) {
      return status;
    }
  }
  return Status::OK();
}

Status PageDecoder::DecodeAtom(Reader &reader, FieldValue *value) const {
  const Byte *p;
  Status status;
  switch (column_.dtype_) {
  case idl::INT64:
    status = reader.Take(8, p, "int64");
    if (status.ok()) {
      value->set_int64_val(ByteUtil::GetInt64(p));
    }
    return status;
  case idl::FLOAT32:
    status = reader.Take(4, p, "float32");
    if (status.ok()) {
      value->set_float32_val(ByteUtil::GetFloat32(p));
    }
    return status;
  case idl::FLOAT64:
    status = reader.Take(8, p, "float64");
    if (status.ok()) {
      value->set_float64_val(ByteUtil::GetFloat64(p));
    }
    return status;
  case idl::BOOL: {
    uint8_t b;
    status = reader.ReadByte(b, "bool");
    if (!status.ok()) {
      return status;
    }
    if (b > 1) {
      return Status::Error(ErrorCode::DecodeError,
                           fmt::format("invalid bool byte {:#04x} at offset {}",
                                       b, reader.Offset() - 1));
    }
    value->set_bool_val(b == 1);
    return Status::OK();
  }
  case idl::TIMESTAMP_MICROS:
    status = reader.Take(8, p, "timestamp");
    if (status.ok()) {
      *value->mutable_timestamp_val() =
          google::protobuf::util::TimeUtil::MicrosecondsToTimestamp(
              ByteUtil::GetInt64(p));
    }
    return status;
  case idl::STRING:
  case idl::BYTES: {
    uint32_t len;
    status = reader.ReadUint32(len, "length prefix");
    if (!status.ok()) {
      return status;
    }
    status = reader.Take(len, p, column_.dtype_ == idl::STRING ? "string"
                                                               : "bytes");
    if (!status.ok()) {
      return status;
    }
    if (column_.dtype_ == idl::BYTES) {
      value->set_bytes_val(reinterpret_cast<const char *>(p), len);
      return Status::OK();
    }
    if (!StringUtil::IsValidUtf8(p, len)) {
      return Status::Error(ErrorCode::DecodeError,
                           fmt::format("invalid UTF-8 in string at offset {}",
                                       reader.Offset() - len));
    }
    value->set_string_val(reinterpret_cast<const char *>(p), len);
    return Status::OK();
  }
  default: break;
  }
  return Status::Error(ErrorCode::InvalidArgument,
                       fmt::format("column {} has unsupported dtype {}",
                                   column_.name_,
                                   static_cast<int>(column_.dtype_)));
}

} // namespace Pancake
