#include "reader/ColumnStreamReader.hpp"
#include "common/Logger.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <iterator>

namespace Pancake {

ColumnStreamReader::ColumnStreamReader(RpcGatewayRef gateway,
                                       SegmentKey segment,
                                       ColumnDescriptor column,
                                       std::string correlation_id,
                                       RetryPolicy retry_policy,
                                       CancelFlag cancelled)
    : gateway_(std::move(gateway)), segment_(std::move(segment)),
      decoder_(std::move(column)), correlation_id_(std::move(correlation_id)),
      retry_policy_(retry_policy), cancelled_(std::move(cancelled)) {}

Status ColumnStreamReader::ReadAll(std::vector<FieldValue> &values) {
  const auto &column = decoder_.GetColumn();
  state_ = ReadState::Start;
  while (true) {
    switch (state_) {
    case ReadState::Start:
      token_.clear();
      sent_tokens_.clear();
      implicit_nulls_count_ = 0;
      accumulated_.clear();
      pages_read_ = 0;
      failure_ = Status::OK();
      if (!gateway_) {
        failure_ = Status::Error(ErrorCode::InvalidArgument,
                                 "column reader has no rpc gateway");
        state_ = ReadState::Failed;
        break;
      }
      state_ = ReadState::Fetching;
      break;

    case ReadState::Fetching: {
      RawColumnPage page;
      auto status = FetchPage(page);
      if (status.ok()) {
        status = decoder_.Decode(page.data_, 0, accumulated_);
      }
      if (status.ok() && !page.continuation_token_.empty() &&
          sent_tokens_.contains(page.continuation_token_)) {
        status = Status::Error(
            ErrorCode::ProtocolError,
            fmt::format("server repeated continuation token {} for column {}",
                        page.continuation_token_, column.name_));
      }
      if (!status.ok()) {
        failure_ = std::move(status);
        state_ = ReadState::Failed;
        break;
      }
      pages_read_++;
      implicit_nulls_count_ = page.implicit_nulls_count_;
      LOG_DEBUG("column {} of {}: page {} done, {} values so far", column.name_,
                segment_.ToString(), pages_read_, accumulated_.size());
      token_ = std::move(page.continuation_token_);
      if (token_.empty()) {
        state_ = ReadState::Done;
      } else {
        sent_tokens_.insert(token_);
        state_ = ReadState::Continue;
      }
      break;
    }

    case ReadState::Continue: state_ = ReadState::Fetching; break;

    case ReadState::Done:
      if (implicit_nulls_count_ > 0) {
        std::vector<FieldValue> with_nulls(implicit_nulls_count_);
        with_nulls.reserve(with_nulls.size() + accumulated_.size());
        std::move(accumulated_.begin(), accumulated_.end(),
                  std::back_inserter(with_nulls));
        accumulated_ = std::move(with_nulls);
      }
      LOG_DEBUG("column {} of {}: {} values ({} implicit nulls) in {} pages",
                column.name_, segment_.ToString(), accumulated_.size(),
                implicit_nulls_count_, pages_read_);
      values = std::move(accumulated_);
      accumulated_ = {};
      return Status::OK();

    case ReadState::Failed:
      LOG_ERROR("column {} of {} failed after {} pages: {}", column.name_,
                segment_.ToString(), pages_read_, failure_.ToString());
      accumulated_ = {};
      return failure_;
    }
  }
}

Status ColumnStreamReader::FetchPage(RawColumnPage &page) {
  idl::ReadSegmentColumnRequest req;
  req.set_table_name(segment_.table_name_);
  segment_.CopyPartitionTo(req.mutable_partition());
  req.set_segment_id(segment_.segment_id_);
  req.set_column_name(decoder_.GetColumn().name_);
  req.set_correlation_id(correlation_id_);
  req.set_continuation_token(token_);

  idl::ReadSegmentColumnResponse resp;
  auto what = fmt::format("ReadSegmentColumn {} of {}",
                          decoder_.GetColumn().name_, segment_.ToString());
  auto status = CallWithRetry(retry_policy_, what, cancelled_.get(), [&]() {
    resp.Clear();
    return gateway_->ReadSegmentColumn(req, resp);
  });
  if (!status.ok()) {
    return status;
  }
  page.data_ = std::move(*resp.mutable_data());
  page.continuation_token_ = std::move(*resp.mutable_continuation_token());
  page.implicit_nulls_count_ = resp.implicit_nulls_count();
  return Status::OK();
}
} // namespace Pancake
