#pragma once

#include "common/Status.hpp"
#include "type/WireTypes.hpp"

#include <memory>

namespace Pancake {

// Unary request/response calls against a PancakeDB server.
//
// Implementations own the transport (channels, TLS, credentials, timeouts)
// and must accept concurrent calls from several threads: the row assembler
// reads the columns of a segment in parallel through one gateway.
//
// A failure that may succeed when sent again unchanged is reported as
// ErrorCode::TransportError; errors returned by the server itself as
// ErrorCode::RemoteError. Methods a transport does not support keep the
// default Unimplemented answer.
class RpcGateway {
public:
  virtual ~RpcGateway() = default;

  virtual Status CreateTable(const idl::CreateTableRequest &req,
                             idl::CreateTableResponse &resp) {
    return Unimplemented("CreateTable");
  }

  virtual Status AlterTable(const idl::AlterTableRequest &req,
                            idl::AlterTableResponse &resp) {
    return Unimplemented("AlterTable");
  }

  virtual Status DropTable(const idl::DropTableRequest &req,
                           idl::DropTableResponse &resp) {
    return Unimplemented("DropTable");
  }

  virtual Status GetSchema(const idl::GetSchemaRequest &req,
                           idl::GetSchemaResponse &resp) {
    return Unimplemented("GetSchema");
  }

  virtual Status ListTables(const idl::ListTablesRequest &req,
                            idl::ListTablesResponse &resp) {
    return Unimplemented("ListTables");
  }

  virtual Status ListSegments(const idl::ListSegmentsRequest &req,
                              idl::ListSegmentsResponse &resp) {
    return Unimplemented("ListSegments");
  }

  virtual Status WriteToPartition(const idl::WriteToPartitionRequest &req,
                                  idl::WriteToPartitionResponse &resp) {
    return Unimplemented("WriteToPartition");
  }

  virtual Status DeleteFromSegment(const idl::DeleteFromSegmentRequest &req,
                                   idl::DeleteFromSegmentResponse &resp) {
    return Unimplemented("DeleteFromSegment");
  }

  virtual Status ReadSegmentColumn(const idl::ReadSegmentColumnRequest &req,
                                   idl::ReadSegmentColumnResponse &resp) = 0;

  virtual Status
  ReadSegmentDeletions(const idl::ReadSegmentDeletionsRequest &req,
                       idl::ReadSegmentDeletionsResponse &resp) {
    return Unimplemented("ReadSegmentDeletions");
  }

protected:
  static Status Unimplemented(const char *rpc) {
    return Status::Error(ErrorCode::Unimplemented,
                         std::string{rpc} + " is not supported by this gateway");
  }
};

using RpcGatewayRef = std::shared_ptr<RpcGateway>;
} // namespace Pancake
