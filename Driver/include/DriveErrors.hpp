#pragma once

#include <stdexcept>
#include <string>

// Every error raised by the driver derives from DriveError, so callers can
// catch the whole family at once or a single failure kind.
class DriveError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Encode inputs that cannot form a valid frame (payload/byte count mismatch,
// byte count above 4, value out of range for its register width).
class InvalidFrameError final : public DriveError {
 public:
  using DriveError::DriveError;
};

// Reply too short, not echoing the request, or a Modbus exception response.
class MalformedReplyError final : public DriveError {
 public:
  using DriveError::DriveError;
};

// Transport failure, early close or read timeout of a single exchange.
class ConnectionError final : public DriveError {
 public:
  using DriveError::DriveError;
};

class UnknownHomingMethodError final : public DriveError {
 public:
  using DriveError::DriveError;
};

// A status wait spent its poll budget without seeing the expected reply.
class OperationTimedOut final : public DriveError {
 public:
  using DriveError::DriveError;
};

// The caller requested a stop while an operation was polling.
class OperationCancelled final : public DriveError {
 public:
  using DriveError::DriveError;
};
