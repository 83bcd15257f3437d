#include "client/Client.hpp"
#include "common/util/CorrelationId.hpp"
#include "reader/RowAssembler.hpp"

#include "fmt/format.h"

namespace Pancake {

Status Client::CreateTable(const idl::CreateTableRequest &req,
                           idl::CreateTableResponse &resp) {
  return Forward("CreateTable", &RpcGateway::CreateTable, req, resp, false);
}

Status Client::AlterTable(const idl::AlterTableRequest &req,
                          idl::AlterTableResponse &resp) {
  return Forward("AlterTable", &RpcGateway::AlterTable, req, resp, false);
}

Status Client::DropTable(const idl::DropTableRequest &req,
                         idl::DropTableResponse &resp) {
  return Forward("DropTable", &RpcGateway::DropTable, req, resp, false);
}

Status Client::GetSchema(const idl::GetSchemaRequest &req,
                         idl::GetSchemaResponse &resp) {
  return Forward("GetSchema", &RpcGateway::GetSchema, req, resp, true);
}

Status Client::ListTables(const idl::ListTablesRequest &req,
                          idl::ListTablesResponse &resp) {
  return Forward("ListTables", &RpcGateway::ListTables, req, resp, true);
}

Status Client::ListSegments(const idl::ListSegmentsRequest &req,
                            idl::ListSegmentsResponse &resp) {
  return Forward("ListSegments", &RpcGateway::ListSegments, req, resp, true);
}

Status Client::WriteToPartition(const idl::WriteToPartitionRequest &req,
                                idl::WriteToPartitionResponse &resp) {
  return Forward("WriteToPartition", &RpcGateway::WriteToPartition, req, resp,
                 false);
}

Status Client::DeleteFromSegment(const idl::DeleteFromSegmentRequest &req,
                                 idl::DeleteFromSegmentResponse &resp) {
  return Forward("DeleteFromSegment", &RpcGateway::DeleteFromSegment, req,
                 resp, false);
}

Status Client::ReadSegmentColumn(const idl::ReadSegmentColumnRequest &req,
                                 idl::ReadSegmentColumnResponse &resp) {
  return Forward("ReadSegmentColumn", &RpcGateway::ReadSegmentColumn, req,
                 resp, true);
}

Status Client::ReadSegmentDeletions(const idl::ReadSegmentDeletionsRequest &req,
                                    idl::ReadSegmentDeletionsResponse &resp) {
  return Forward("ReadSegmentDeletions", &RpcGateway::ReadSegmentDeletions,
                 req, resp, true);
}

Status Client::FetchDeletions(const SegmentKey &segment,
                              const std::string &correlation_id,
                              DeletionBitmap &deletions, CancelFlag cancelled) {
  if (!gateway_) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "client has no rpc gateway");
  }
  idl::ReadSegmentDeletionsRequest req;
  req.set_table_name(segment.table_name_);
  segment.CopyPartitionTo(req.mutable_partition());
  req.set_segment_id(segment.segment_id_);
  req.set_correlation_id(correlation_id);

  idl::ReadSegmentDeletionsResponse resp;
  auto status = CallWithRetry(
      options_.retry_policy_,
      fmt::format("ReadSegmentDeletions of {}", segment.ToString()),
      cancelled.get(), [&]() {
        resp.Clear();
        return gateway_->ReadSegmentDeletions(req, resp);
      });
  if (!status.ok()) {
    return status;
  }
  deletions = DeletionBitmap(std::move(*resp.mutable_data()));
  return Status::OK();
}

Status Client::DecodeIsDeleted(const SegmentKey &segment,
                               const std::string &correlation_id,
                               std::vector<bool> &is_deleted) {
  DeletionBitmap deletions;
  auto status = FetchDeletions(segment, correlation_id, deletions, nullptr);
  if (!status.ok()) {
    return status;
  }
  is_deleted = deletions.ToVector();
  return Status::OK();
}

Status Client::DecodeSegmentColumn(const SegmentKey &segment,
                                   const ColumnDescriptor &column,
                                   std::vector<FieldValue> &values) {
  return DecodeSegmentColumn(segment, column, NewCorrelationId(), values);
}

Status Client::DecodeSegmentColumn(const SegmentKey &segment,
                                   const ColumnDescriptor &column,
                                   const std::string &correlation_id,
                                   std::vector<FieldValue> &values,
                                   CancelFlag cancelled) {
  auto status = RowAssembler::ValidateColumns({column});
  if (!status.ok()) {
    return status;
  }
  ColumnStreamReader reader(gateway_, segment, column, correlation_id,
                            options_.retry_policy_, std::move(cancelled));
  return reader.ReadAll(values);
}

Status Client::DecodeSegment(const SegmentKey &segment,
                             const std::vector<ColumnDescriptor> &columns,
                             std::vector<Row> &rows, CancelFlag cancelled) {
  auto status = RowAssembler::ValidateColumns(columns);
  if (!status.ok()) {
    return status;
  }
  if (!cancelled) {
    cancelled = std::make_shared<std::atomic<bool>>(false);
  }

  // one snapshot for the deletions and every column
  auto correlation_id = NewCorrelationId();
  DeletionBitmap deletions;
  status = FetchDeletions(segment, correlation_id, deletions, cancelled);
  if (status.Code() == ErrorCode::Unimplemented) {
    LOG_DEBUG("no deletion data for {}: {}", segment.ToString(),
              status.GetMessage());
    deletions = DeletionBitmap{};
  } else if (!status.ok()) {
    return status;
  }

  RowAssembler assembler(gateway_, options_.retry_policy_,
                         options_.column_schedule_);
  return assembler.Assemble(segment, columns, correlation_id, deletions, rows,
                            std::move(cancelled));
}
} // namespace Pancake
