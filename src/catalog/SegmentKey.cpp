#include "catalog/SegmentKey.hpp"

#include "fmt/format.h"

#include <google/protobuf/util/time_util.h>

namespace Pancake {

static std::string PartitionValueToString(const PartitionFieldValue &value) {
  switch (value.value_case()) {
  case PartitionFieldValue::kStringVal: return value.string_val();
  case PartitionFieldValue::kInt64Val: return std::to_string(value.int64_val());
  case PartitionFieldValue::kBoolVal: return value.bool_val() ? "true" : "false";
  case PartitionFieldValue::kTimestampVal:
    return google::protobuf::util::TimeUtil::ToString(value.timestamp_val());
  case PartitionFieldValue::VALUE_NOT_SET: return "null";
  }
  return "null";
}

std::string PartitionToString(const Partition &partition) {
  std::string res;
  for (const auto &field : partition) {
    if (!res.empty()) {
      res += ',';
    }
    res += fmt::format("{}={}", field.name(),
                       PartitionValueToString(field.value()));
  }
  return res;
}

std::string SegmentKey::ToString() const {
  return fmt::format("{}/{}/{}", table_name_, PartitionToString(partition_),
                     segment_id_);
}
} // namespace Pancake
