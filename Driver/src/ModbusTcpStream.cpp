#include "ModbusTcpStream.hpp"

#include <Logger.hpp>

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <format>
#include <utility>

namespace {
TransportError lastModbusError() {
  const int err = errno;
  return TransportError{err, modbus_strerror(err), TransportErrorKind::Io};
}

TransportError socketError(const std::string_view what) {
  const int err = errno;
  return TransportError{err, std::format("{}: {}", what, modbus_strerror(err)),
                        TransportErrorKind::Io};
}
}  // namespace

TransportResult<ModbusTcpStream> ModbusTcpStream::open(
    const std::string_view host, const int port,
    const std::chrono::milliseconds connectTimeout,
    const std::chrono::milliseconds readTimeout) {
  const std::string hostStr{host};
  modbus_t* ctx = modbus_new_tcp(hostStr.c_str(), port);
  if (!ctx) {
    return std::unexpected(
        TransportError{errno, "modbus_new_tcp failed", TransportErrorKind::Io});
  }

  // libmodbus applies the response timeout to the non-blocking connect
  const auto sec = static_cast<uint32_t>(connectTimeout.count() / 1000);
  const auto usec = static_cast<uint32_t>((connectTimeout.count() % 1000) * 1000);
  if (modbus_set_response_timeout(ctx, sec, usec) == -1) {
    auto err = lastModbusError();
    modbus_free(ctx);
    return std::unexpected(err);
  }

  if (modbus_connect(ctx) == -1) {
    auto err = lastModbusError();
    err.message = std::format("connect to {}:{} failed: {}", hostStr, port,
                              err.message);
    modbus_free(ctx);
    return std::unexpected(err);
  }

  SPDLOG_INFO("Connected to dryve D1 at {}:{}", hostStr, port);
  return ModbusTcpStream(ctx, hostStr, port, readTimeout);
}

ModbusTcpStream::ModbusTcpStream(modbus_t* ctx, std::string host, const int port,
                                 const std::chrono::milliseconds readTimeout)
    : _ctx(ctx), _host(std::move(host)), _port(port), _readTimeout(readTimeout) {}

ModbusTcpStream::ModbusTcpStream(ModbusTcpStream&& other) noexcept
    : _ctx(std::exchange(other._ctx, nullptr)),
      _host(std::move(other._host)),
      _port(other._port),
      _readTimeout(other._readTimeout) {}

ModbusTcpStream& ModbusTcpStream::operator=(ModbusTcpStream&& other) noexcept {
  if (this != &other) {
    closeNoThrow();
    _ctx = std::exchange(other._ctx, nullptr);
    _host = std::move(other._host);
    _port = other._port;
    _readTimeout = other._readTimeout;
  }
  return *this;
}

ModbusTcpStream::~ModbusTcpStream() { closeNoThrow(); }

TransportResult<void> ModbusTcpStream::send(
    const std::span<const std::uint8_t> bytes) {
  if (!isOpen()) {
    return std::unexpected(closedError("send on closed stream"));
  }
  const int fd = modbus_get_socket(_ctx);
  std::size_t written = 0;
  while (written < bytes.size()) {
    const auto rc = ::send(fd, bytes.data() + written, bytes.size() - written,
                           MSG_NOSIGNAL);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        auto err = socketError("send failed");
        err.kind = TransportErrorKind::Closed;
        return std::unexpected(err);
      }
      return std::unexpected(socketError("send failed"));
    }
    written += static_cast<std::size_t>(rc);
  }
  return {};
}

TransportResult<std::vector<std::uint8_t>> ModbusTcpStream::receive(
    const std::size_t count) {
  if (!isOpen()) {
    return std::unexpected(closedError("receive on closed stream"));
  }
  const int fd = modbus_get_socket(_ctx);
  std::vector<std::uint8_t> buffer(count);
  std::size_t received = 0;
  const auto deadline = std::chrono::steady_clock::now() + _readTimeout;

  while (received < count) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      TransportError err{
          ETIMEDOUT,
          std::format("no reply from {} within {} ms ({} of {} bytes)",
                      describe(), _readTimeout.count(), received, count),
          TransportErrorKind::Timeout};
      // Replies carry no transaction id, so a late one would be taken as the
      // answer to the next request.
      SPDLOG_WARN("Closing {} after read timeout", describe());
      closeNoThrow();
      return std::unexpected(err);
    }

    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(socketError("poll failed"));
    }
    if (ready == 0) {
      continue;
    }

    const auto rc = ::recv(fd, buffer.data() + received, count - received, 0);
    if (rc == 0) {
      return std::unexpected(closedError(
          std::format("peer closed after {} of {} bytes", received, count)));
    }
    if (rc == -1) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return std::unexpected(socketError("recv failed"));
    }
    received += static_cast<std::size_t>(rc);
  }
  return buffer;
}

void ModbusTcpStream::closeNoThrow() noexcept {
  if (_ctx) {
    modbus_close(_ctx);
    modbus_free(_ctx);
    _ctx = nullptr;
    SPDLOG_INFO("Closed connection to {}:{}", _host, _port);
  }
}

bool ModbusTcpStream::isOpen() const {
  return _ctx != nullptr && modbus_get_socket(_ctx) >= 0;
}

std::string ModbusTcpStream::describe() const {
  return std::format("tcp({}:{})", _host, _port);
}

TransportError ModbusTcpStream::closedError(const std::string_view what) const {
  return TransportError{ENOTCONN, std::format("{}: {}", describe(), what),
                        TransportErrorKind::Closed};
}
