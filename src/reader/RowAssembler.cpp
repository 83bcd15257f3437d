#include "reader/RowAssembler.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/util/StringUtil.hpp"

#include "fmt/format.h"

#include <future>
#include <unordered_set>
#include <utility>

namespace Pancake {

Status RowAssembler::ValidateColumns(
    const std::vector<ColumnDescriptor> &columns) {
  if (columns.empty()) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "unable to decode segment with no columns specified");
  }
  std::unordered_set<std::string> seen;
  for (const auto &column : columns) {
    if (!StringUtil::ValidName(column.name_)) {
      return Status::Error(
          ErrorCode::InvalidArgument,
          fmt::format("invalid column name \"{}\"", column.name_));
    }
    if (column.nested_list_depth_ > MAX_NESTED_LIST_DEPTH) {
      return Status::Error(
          ErrorCode::InvalidArgument,
          fmt::format("column {} nests lists {} deep, at most {} supported",
                      column.name_, column.nested_list_depth_,
                      MAX_NESTED_LIST_DEPTH));
    }
    if (!seen.insert(column.name_).second) {
      return Status::Error(
          ErrorCode::InvalidArgument,
          fmt::format("column {} requested more than once", column.name_));
    }
  }
  return Status::OK();
}

Status RowAssembler::CheckAlignment(
    const SegmentKey &segment, const std::vector<ColumnDescriptor> &columns,
    const std::vector<std::vector<FieldValue>> &results) {
  bool aligned = true;
  for (const auto &values : results) {
    aligned &= values.size() == results.front().size();
  }
  if (aligned) {
    return Status::OK();
  }
  std::string lengths;
  for (size_t i = 0; i < columns.size(); i++) {
    if (i > 0) {
      lengths += ", ";
    }
    lengths += fmt::format("{}={}", columns[i].name_, results[i].size());
  }
  return Status::Error(
      ErrorCode::RowAlignmentError,
      fmt::format("columns of table {} partition [{}] segment {} disagree on "
                  "row count: {}",
                  segment.table_name_, PartitionToString(segment.partition_),
                  segment.segment_id_, lengths));
}

Status RowAssembler::ReadColumns(const SegmentKey &segment,
                                 const std::vector<ColumnDescriptor> &columns,
                                 const std::string &correlation_id,
                                 std::vector<std::vector<FieldValue>> &results,
                                 CancelFlag cancelled) const {
  if (!cancelled) {
    cancelled = std::make_shared<std::atomic<bool>>(false);
  }
  std::vector<std::vector<FieldValue>> values(columns.size());

  if (schedule_ == ColumnSchedule::Sequential || columns.size() == 1) {
    for (size_t i = 0; i < columns.size(); i++) {
      ColumnStreamReader reader(gateway_, segment, columns[i], correlation_id,
                                retry_policy_, cancelled);
      auto status = reader.ReadAll(values[i]);
      if (!status.ok()) {
        return status;
      }
    }
    results = std::move(values);
    return Status::OK();
  }

  std::vector<std::future<Status>> tasks;
  tasks.reserve(columns.size());
  for (size_t i = 0; i < columns.size(); i++) {
    tasks.push_back(std::async(std::launch::async, [&, i, cancelled]() {
      ColumnStreamReader reader(gateway_, segment, columns[i], correlation_id,
                                retry_policy_, cancelled);
      auto status = reader.ReadAll(values[i]);
      if (!status.ok()) {
        cancelled->store(true);
      }
      return status;
    }));
  }

  // join everything before looking at results; a sibling's Cancelled is a
  // consequence, not the cause
  Status failure;
  for (auto &task : tasks) {
    auto status = task.get();
    if (status.ok()) {
      continue;
    }
    if (failure.ok() || (failure.Code() == ErrorCode::Cancelled &&
                         status.Code() != ErrorCode::Cancelled)) {
      failure = std::move(status);
    }
  }
  if (!failure.ok()) {
    return failure;
  }
  results = std::move(values);
  return Status::OK();
}

Status RowAssembler::Assemble(const SegmentKey &segment,
                              const std::vector<ColumnDescriptor> &columns,
                              const std::string &correlation_id,
                              const DeletionBitmap &deletions,
                              std::vector<Row> &rows,
                              CancelFlag cancelled) const {
  auto status = ValidateColumns(columns);
  if (!status.ok()) {
    return status;
  }

  std::vector<std::vector<FieldValue>> values;
  status = ReadColumns(segment, columns, correlation_id, values,
                       std::move(cancelled));
  if (!status.ok()) {
    return status;
  }
  if (columns.size() > 1) {
    status = CheckAlignment(segment, columns, values);
    if (!status.ok()) {
      LOG_ERROR("{}", status.GetMessage());
      return status;
    }
  }

  size_t row_count = values.front().size();
  std::vector<Row> assembled;
  assembled.reserve(row_count - deletions.DeletedCount(row_count));
  for (size_t i = 0; i < row_count; i++) {
    if (deletions.IsDeleted(i)) {
      continue;
    }
    Row row(columns.size());
    for (size_t j = 0; j < columns.size(); j++) {
      row.Insert(columns[j].name_, std::move(values[j][i]));
    }
    assembled.push_back(std::move(row));
  }

  LOG_INFO("decoded segment {}: {} columns, {} rows, {} deleted",
           segment.ToString(), columns.size(), assembled.size(),
           row_count - assembled.size());
  rows = std::move(assembled);
  return Status::OK();
}
} // namespace Pancake
