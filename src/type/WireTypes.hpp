#pragma once

#include "gen_cpp/pancake.pb.h"

#include <vector>

namespace Pancake {
namespace idl = pancake::idl;

using DataType = idl::DataType;
using FieldValue = idl::FieldValue;
using PartitionField = idl::PartitionField;
using PartitionFieldValue = idl::PartitionFieldValue;
using Partition = std::vector<PartitionField>;
} // namespace Pancake
