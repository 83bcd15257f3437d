#include "catalog/ColumnDescriptor.hpp"
#include "common/Config.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace Pancake {

std::string ColumnDescriptor::ToString() const {
  std::string type_name = idl::DataType_Name(dtype_);
  for (uint32_t i = 0; i < nested_list_depth_; i++) {
    type_name = fmt::format("LIST<{}>", type_name);
  }
  return fmt::format("{} {}", name_, type_name);
}

Status ColumnDescriptorsFromSchema(const idl::Schema &schema,
                                   std::vector<ColumnDescriptor> &columns) {
  columns.clear();
  columns.reserve(schema.columns_size());
  for (const auto &[name, meta] : schema.columns()) {
    if (!idl::DataType_IsValid(meta.dtype())) {
      return Status::Error(
          ErrorCode::InvalidArgument,
          fmt::format("column {} has unknown dtype {}", name,
                      static_cast<int>(meta.dtype())));
    }
    if (meta.nested_list_depth() > MAX_NESTED_LIST_DEPTH) {
      return Status::Error(
          ErrorCode::InvalidArgument,
          fmt::format("column {} nests lists {} deep, at most {} supported",
                      name, meta.nested_list_depth(), MAX_NESTED_LIST_DEPTH));
    }
    columns.emplace_back(name, meta.dtype(), meta.nested_list_depth());
  }
  // protobuf maps have no stable order
  std::sort(columns.begin(), columns.end(),
            [](const ColumnDescriptor &l, const ColumnDescriptor &r) {
              return l.name_ < r.name_;
            });
  return Status::OK();
}
} // namespace Pancake
