#pragma once

#include "catalog/ColumnDescriptor.hpp"
#include "catalog/SegmentKey.hpp"
#include "codec/PageDecoder.hpp"
#include "common/EnumClass.hpp"
#include "common/Status.hpp"
#include "rpc/RetryPolicy.hpp"
#include "rpc/RpcGateway.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace Pancake {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

// Materializes every value of one column of one segment, following
// continuation tokens until the server reports the column exhausted.
//
//   Start -> Fetching -> Continue -> Fetching -> ... -> Done
//                 \-> Failed
//
// Each request carries the token of the response before it; a server that
// hands out a token already sent is rejected. Transient transport failures
// are retried at the same token; decode failures are not.
//
// Implicit nulls are rows written before the column existed. The count of
// the last response is prepended once to the decoded values.
// The read is all or nothing: on failure the values gathered so far are
// dropped and the caller's vector is not touched.
class ColumnStreamReader {
public:
  ColumnStreamReader(RpcGatewayRef gateway, SegmentKey segment,
                     ColumnDescriptor column, std::string correlation_id,
                     RetryPolicy retry_policy = {},
                     CancelFlag cancelled = nullptr);

  Status ReadAll(std::vector<FieldValue> &values);

  ReadState GetState() const { return state_; }

  size_t GetPagesRead() const { return pages_read_; }

  const ColumnDescriptor &GetColumn() const { return decoder_.GetColumn(); }

private:
  Status FetchPage(RawColumnPage &page);

  RpcGatewayRef gateway_;
  SegmentKey segment_;
  PageDecoder decoder_;
  std::string correlation_id_;
  RetryPolicy retry_policy_;
  CancelFlag cancelled_;

  ReadState state_{ReadState::Start};
  std::string token_;
  std::unordered_set<std::string> sent_tokens_;
  uint32_t implicit_nulls_count_{0};
  std::vector<FieldValue> accumulated_;
  Status failure_;
  size_t pages_read_{0};
};
} // namespace Pancake
