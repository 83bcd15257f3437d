#pragma once

#include "common/Status.hpp"
#include "type/WireTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace Pancake {
struct ColumnDescriptor {
  std::string name_;
  DataType dtype_{idl::INT64};
  // 0 for scalars, N for N-deep lists of dtype_
  uint32_t nested_list_depth_{0};

  ColumnDescriptor() = default;
  ColumnDescriptor(std::string name, DataType dtype,
                   uint32_t nested_list_depth = 0)
      : name_(std::move(name)), dtype_(dtype),
        nested_list_depth_(nested_list_depth) {}

  std::string ToString() const;

  bool operator==(const ColumnDescriptor &other) const = default;
};

// Descriptors for every column of the schema, ordered by name.
Status ColumnDescriptorsFromSchema(const idl::Schema &schema,
                                   std::vector<ColumnDescriptor> &columns);
} // namespace Pancake
