#pragma once

#include "catalog/ColumnDescriptor.hpp"
#include "catalog/SegmentKey.hpp"
#include "codec/DeletionBitmap.hpp"
#include "common/EnumClass.hpp"
#include "common/Logger.hpp"
#include "common/Status.hpp"
#include "reader/ColumnStreamReader.hpp"
#include "row/Row.hpp"
#include "rpc/RetryPolicy.hpp"
#include "rpc/RpcGateway.hpp"

#include <string>
#include <vector>

namespace Pancake {

struct ClientOptions {
  RetryPolicy retry_policy_{};
  ColumnSchedule column_schedule_{ColumnSchedule::Parallel};
};

// Entry point of the library. Every server RPC is available as a typed call;
// on top of those, DecodeSegmentColumn and DecodeSegment turn the paginated
// binary column reads into values and rows.
//
//   auto client = Client(std::make_shared<MyGateway>(...));
//   std::vector<Row> rows;
//   auto status = client.DecodeSegment(segment, columns, rows);
//
// A Client may be used from several threads as long as its gateway allows it.
class Client {
public:
  explicit Client(RpcGatewayRef gateway, ClientOptions options = {})
      : gateway_(std::move(gateway)), options_(options) {}

  // Creates, asserts or declaratively extends a table.
  Status CreateTable(const idl::CreateTableRequest &req,
                     idl::CreateTableResponse &resp);

  // Adds columns to an existing table.
  Status AlterTable(const idl::AlterTableRequest &req,
                    idl::AlterTableResponse &resp);

  // Drops a table along with all of its data.
  Status DropTable(const idl::DropTableRequest &req,
                   idl::DropTableResponse &resp);

  Status GetSchema(const idl::GetSchemaRequest &req,
                   idl::GetSchemaResponse &resp);

  Status ListTables(const idl::ListTablesRequest &req,
                    idl::ListTablesResponse &resp);

  Status ListSegments(const idl::ListSegmentsRequest &req,
                      idl::ListSegmentsResponse &resp);

  // Rows are easiest built with MakeRow and the partition with MakePartition.
  Status WriteToPartition(const idl::WriteToPartitionRequest &req,
                          idl::WriteToPartitionResponse &resp);

  Status DeleteFromSegment(const idl::DeleteFromSegmentRequest &req,
                           idl::DeleteFromSegmentResponse &resp);

  // Raw single page read. Most callers want DecodeSegmentColumn instead.
  Status ReadSegmentColumn(const idl::ReadSegmentColumnRequest &req,
                           idl::ReadSegmentColumnResponse &resp);

  // Raw deletion bitmap read. Most callers want DecodeSegment instead.
  Status ReadSegmentDeletions(const idl::ReadSegmentDeletionsRequest &req,
                              idl::ReadSegmentDeletionsResponse &resp);

  // Per-row deleted flags of the segment. Rows past the end of is_deleted
  // are live.
  Status DecodeIsDeleted(const SegmentKey &segment,
                         const std::string &correlation_id,
                         std::vector<bool> &is_deleted);

  // Every value of one column, following continuation tokens. Deleted rows
  // are not filtered here.
  Status DecodeSegmentColumn(const SegmentKey &segment,
                             const ColumnDescriptor &column,
                             std::vector<FieldValue> &values);

  Status DecodeSegmentColumn(const SegmentKey &segment,
                             const ColumnDescriptor &column,
                             const std::string &correlation_id,
                             std::vector<FieldValue> &values,
                             CancelFlag cancelled = nullptr);

  // The live rows of the segment, each holding the requested columns in
  // the given order. A gateway without ReadSegmentDeletions is read as a
  // segment with no deleted rows.
  Status DecodeSegment(const SegmentKey &segment,
                       const std::vector<ColumnDescriptor> &columns,
                       std::vector<Row> &rows, CancelFlag cancelled = nullptr);

private:
  Status FetchDeletions(const SegmentKey &segment,
                        const std::string &correlation_id,
                        DeletionBitmap &deletions, CancelFlag cancelled);

  template <typename Req, typename Resp>
  Status Forward(const char *rpc,
                 Status (RpcGateway::*method)(const Req &, Resp &),
                 const Req &req, Resp &resp, bool idempotent) {
    if (!gateway_) {
      return Status::Error(ErrorCode::InvalidArgument,
                           "client has no rpc gateway");
    }
    LOG_DEBUG("{} request", rpc);
    auto call = [&]() {
      resp.Clear();
      return ((*gateway_).*method)(req, resp);
    };
    auto status = idempotent ? CallWithRetry(options_.retry_policy_, rpc,
                                             nullptr, call)
                             : call();
    if (!status.ok()) {
      LOG_WARN("{} failed: {}", rpc, status.ToString());
    }
    return status;
  }

  RpcGatewayRef gateway_;
  ClientOptions options_;
};
} // namespace Pancake
