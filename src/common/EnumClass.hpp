#pragma once

enum class ErrorCode {
  OK,
  TransportError,
  DecodeError,
  TypeMismatchError,
  RowAlignmentError,
  ProtocolError,
  InvalidArgument,
  Cancelled,
  Unimplemented,
  RemoteError,
};

// Continuation token loop of a single column read.
enum class ReadState {
  Start,
  Fetching,
  Continue,
  Done,
  Failed,
};

// How the row assembler schedules its column readers.
enum class ColumnSchedule {
  Parallel,
  Sequential,
};
