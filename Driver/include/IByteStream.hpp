#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

enum class TransportErrorKind {
  Io,
  Closed,
  Timeout,
};

struct TransportError {
  int errno_value{};
  std::string message{};
  TransportErrorKind kind{TransportErrorKind::Io};
};

template <typename T>
using TransportResult = std::expected<T, TransportError>;

// Ordered, reliable byte pipe to the drive. One request is outstanding at a
// time; the caller owns framing.
class IByteStream {
 public:
  virtual ~IByteStream() = default;

  [[nodiscard]] virtual TransportResult<void> send(
      std::span<const std::uint8_t> bytes) = 0;
  // Exactly `count` bytes, or an error. A short read is an error.
  [[nodiscard]] virtual TransportResult<std::vector<std::uint8_t>> receive(
      std::size_t count) = 0;
  virtual void closeNoThrow() noexcept = 0;
  [[nodiscard]] virtual bool isOpen() const = 0;
  [[nodiscard]] virtual std::string describe() const = 0;
};
