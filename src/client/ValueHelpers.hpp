#pragma once

#include "catalog/SegmentKey.hpp"
#include "type/WireTypes.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace Pancake {

// Binary payload for BYTES columns; a std::vector<uint8_t> would be a list.
struct Bytes {
  std::string data_;
};

using Timestamp = google::protobuf::Timestamp;
using SystemTime = std::chrono::system_clock::time_point;

inline Timestamp ToTimestamp(SystemTime t) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    t.time_since_epoch())
                    .count();
  return google::protobuf::util::TimeUtil::MicrosecondsToTimestamp(micros);
}

// Native value -> FieldValue. Integers map to INT64, float and double to
// FLOAT32 and FLOAT64, strings to STRING, Bytes to BYTES, Timestamp and
// SystemTime to TIMESTAMP_MICROS, std::nullopt to null and std::vector to a
// list of the element conversion.
template <typename T> FieldValue MakeFieldValue(const T &v) {
  FieldValue fv;
  if constexpr (std::is_same_v<T, bool>) {
    fv.set_bool_val(v);
  } else if constexpr (std::is_integral_v<T>) {
    fv.set_int64_val(static_cast<int64_t>(v));
  } else if constexpr (std::is_same_v<T, float>) {
    fv.set_float32_val(v);
  } else if constexpr (std::is_same_v<T, double>) {
    fv.set_float64_val(v);
  } else if constexpr (std::is_same_v<T, Bytes>) {
    fv.set_bytes_val(v.data_);
  } else if constexpr (std::is_same_v<T, Timestamp>) {
    *fv.mutable_timestamp_val() = v;
  } else if constexpr (std::is_same_v<T, SystemTime>) {
    *fv.mutable_timestamp_val() = ToTimestamp(v);
  } else {
    static_assert(std::is_convertible_v<const T &, std::string_view>,
                  "no PancakeDB type for this C++ type");
    fv.set_string_val(std::string{std::string_view{v}});
  }
  return fv;
}

template <typename T> FieldValue MakeFieldValue(const std::optional<T> &v) {
  return v.has_value() ? MakeFieldValue(*v) : FieldValue{};
}

template <typename T> FieldValue MakeFieldValue(const std::vector<T> &v) {
  FieldValue fv;
  auto *list = fv.mutable_list_val();
  for (const auto &elem : v) {
    *list->add_vals() = MakeFieldValue(elem);
  }
  return fv;
}

inline FieldValue NullFieldValue() { return FieldValue{}; }

// MakeRow({{"id", MakeFieldValue(7)}, {"name", MakeFieldValue("x")}})
inline idl::Row
MakeRow(std::initializer_list<std::pair<std::string, FieldValue>> fields) {
  idl::Row row;
  for (const auto &[name, value] : fields) {
    (*row.mutable_fields())[name] = value;
  }
  return row;
}

// Partition values may be strings, integers, bools or timestamps.
template <typename T>
PartitionField MakePartitionField(std::string name, const T &v) {
  PartitionField field;
  field.set_name(std::move(name));
  auto *value = field.mutable_value();
  if constexpr (std::is_same_v<T, bool>) {
    value->set_bool_val(v);
  } else if constexpr (std::is_integral_v<T>) {
    value->set_int64_val(static_cast<int64_t>(v));
  } else if constexpr (std::is_same_v<T, Timestamp>) {
    *value->mutable_timestamp_val() = v;
  } else if constexpr (std::is_same_v<T, SystemTime>) {
    *value->mutable_timestamp_val() = ToTimestamp(v);
  } else {
    static_assert(std::is_convertible_v<const T &, std::string_view>,
                  "partition values are strings, integers, bools or "
                  "timestamps");
    value->set_string_val(std::string{std::string_view{v}});
  }
  return field;
}

// Keeps the given order, which identifies the partition.
inline Partition MakePartition(std::initializer_list<PartitionField> fields) {
  return Partition(fields);
}

inline idl::WriteToPartitionRequest
MakeWriteRequest(std::string table_name, const Partition &partition,
                 std::vector<idl::Row> rows) {
  idl::WriteToPartitionRequest req;
  req.set_table_name(std::move(table_name));
  CopyPartition(partition, req.mutable_partition());
  for (auto &row : rows) {
    *req.add_rows() = std::move(row);
  }
  return req;
}
} // namespace Pancake
