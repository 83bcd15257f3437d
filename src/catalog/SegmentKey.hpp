#pragma once

#include "type/WireTypes.hpp"

#include <google/protobuf/repeated_field.h>

#include <string>

namespace Pancake {
inline void CopyPartition(const Partition &partition,
                          google::protobuf::RepeatedPtrField<PartitionField> *dst) {
  dst->Clear();
  dst->Reserve(static_cast<int>(partition.size()));
  for (const auto &field : partition) {
    *dst->Add() = field;
  }
}

// A fully specified segment: table, partition and segment id.
struct SegmentKey {
  std::string table_name_;
  Partition partition_;
  std::string segment_id_;

  // table/k=v,k2=v2/segment_id, for logs and error messages
  std::string ToString() const;

  void CopyPartitionTo(
      google::protobuf::RepeatedPtrField<PartitionField> *dst) const {
    CopyPartition(partition_, dst);
  }
};

std::string PartitionToString(const Partition &partition);
} // namespace Pancake
