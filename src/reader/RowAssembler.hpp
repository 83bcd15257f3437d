#pragma once

#include "catalog/ColumnDescriptor.hpp"
#include "catalog/SegmentKey.hpp"
#include "codec/DeletionBitmap.hpp"
#include "common/EnumClass.hpp"
#include "common/Status.hpp"
#include "reader/ColumnStreamReader.hpp"
#include "row/Row.hpp"
#include "rpc/RetryPolicy.hpp"
#include "rpc/RpcGateway.hpp"

#include <string>
#include <vector>

namespace Pancake {

// Turns the columns of one segment into rows. Each column is read to the end
// by its own ColumnStreamReader; the readers share nothing but the gateway and
// run as parallel tasks unless the schedule says otherwise. Values with the
// same index across columns form a row.
class RowAssembler {
public:
  explicit RowAssembler(RpcGatewayRef gateway, RetryPolicy retry_policy = {},
                        ColumnSchedule schedule = ColumnSchedule::Parallel)
      : gateway_(std::move(gateway)), retry_policy_(retry_policy),
        schedule_(schedule) {}

  // Rows of segment in on-disk order with fields in the order of columns,
  // leaving out rows set in deletions. Fails without producing rows when any
  // column fails or the columns disagree on their length.
  //
  // cancelled may be shared with the caller to abandon the read; it is also
  // raised here as soon as one column fails so the others stop early.
  Status Assemble(const SegmentKey &segment,
                  const std::vector<ColumnDescriptor> &columns,
                  const std::string &correlation_id,
                  const DeletionBitmap &deletions, std::vector<Row> &rows,
                  CancelFlag cancelled = nullptr) const;

  // results[i] receives every value of columns[i].
  Status ReadColumns(const SegmentKey &segment,
                     const std::vector<ColumnDescriptor> &columns,
                     const std::string &correlation_id,
                     std::vector<std::vector<FieldValue>> &results,
                     CancelFlag cancelled = nullptr) const;

  static Status ValidateColumns(const std::vector<ColumnDescriptor> &columns);

  // Every column of a segment must hold the same number of rows.
  static Status
  CheckAlignment(const SegmentKey &segment,
                 const std::vector<ColumnDescriptor> &columns,
                 const std::vector<std::vector<FieldValue>> &results);

private:
  RpcGatewayRef gateway_;
  RetryPolicy retry_policy_;
  ColumnSchedule schedule_;
};
} // namespace Pancake
