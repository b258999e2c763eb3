#pragma once

#include <modbus.h>

#include <chrono>
#include <string>
#include <string_view>

#include "IByteStream.hpp"

// TCP connection to the dryve D1 gateway. libmodbus owns the socket and the
// connect handshake; frames are exchanged as raw bytes on that socket since
// libmodbus does not frame MEI type 13 replies.
class ModbusTcpStream final : public IByteStream {
 public:
  static constexpr int kDefaultPort = 502;

  // connectTimeout bounds the TCP handshake, readTimeout every receive().
  // A receive() that runs out of time closes the stream.
  static TransportResult<ModbusTcpStream> open(
      std::string_view host, int port, std::chrono::milliseconds connectTimeout,
      std::chrono::milliseconds readTimeout);

  ModbusTcpStream(const ModbusTcpStream&) = delete;
  ModbusTcpStream& operator=(const ModbusTcpStream&) = delete;
  ModbusTcpStream(ModbusTcpStream&& other) noexcept;
  ModbusTcpStream& operator=(ModbusTcpStream&& other) noexcept;
  ~ModbusTcpStream() override;

  [[nodiscard]] TransportResult<void> send(
      std::span<const std::uint8_t> bytes) override;
  [[nodiscard]] TransportResult<std::vector<std::uint8_t>> receive(
      std::size_t count) override;
  void closeNoThrow() noexcept override;
  [[nodiscard]] bool isOpen() const override;
  [[nodiscard]] std::string describe() const override;

 private:
  ModbusTcpStream(modbus_t* ctx, std::string host, int port,
                  std::chrono::milliseconds readTimeout);

  [[nodiscard]] TransportError closedError(std::string_view what) const;

  modbus_t* _ctx{nullptr};
  std::string _host;
  int _port{kDefaultPort};
  std::chrono::milliseconds _readTimeout{0};
};
