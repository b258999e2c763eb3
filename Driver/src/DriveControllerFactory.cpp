#include <DriveController.hpp>

#include <DriveErrors.hpp>
#include <Logger.hpp>
#include <ModbusTcpStream.hpp>
#include <SteadyClockAdapter.hpp>

#include <format>

std::unique_ptr<DriveController> DriveController::open(
    const DriveSettings& settings) {
  static SteadyClockAdapter clock;

  auto stream = ModbusTcpStream::open(settings.host, settings.port,
                                      settings.connectTimeout,
                                      settings.responseTimeout);
  if (!stream) {
    const auto message = std::format(
        "Cannot connect to dryve D1 at {}:{}: {} (errno={})", settings.host,
        settings.port, stream.error().message, stream.error().errno_value);
    SPDLOG_ERROR("{}", message);
    throw ConnectionError(message);
  }
  return std::make_unique<DriveController>(
      std::make_unique<ModbusTcpStream>(std::move(*stream)), settings, clock);
}
