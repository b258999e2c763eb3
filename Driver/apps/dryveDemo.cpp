#include "Config.hpp"
#include "DriveController.hpp"
#include "DriveErrors.hpp"
#include "DriveSettings.hpp"
#include "HomingMethod.hpp"
#include "Logger.hpp"
#include "YamlExtensions.hpp"
#include "argparse/argparse.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>

using namespace std::chrono_literals;

std::atomic running{true};

void signalHandler(int) {
  running = false;
}

using namespace dryve;
namespace fs = std::filesystem;

int main(int argc, char** argv) {

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  configureLogger();

  argparse::ArgumentParser program("dryveDemo");
  program.add_argument("-c", "--config")
      .help("Path to the config file")
      .default_value("/etc/dryve.yaml");
  program.add_argument("--home")
      .help("Run the configured homing method before the move")
      .default_value(false)
      .implicit_value(true);
  program.add_argument("--homing")
      .help("Homing method overriding the configured one (implies --home)");
  program.add_argument("--velocity").default_value(1000).scan<'i', int>();
  program.add_argument("--acceleration").default_value(500).scan<'i', int>();
  program.add_argument("--target").default_value(0).scan<'i', int>();

  try {
    program.parse_args(argc, argv);
  }
  catch (const std::exception& err) {
    SPDLOG_CRITICAL("{}", err.what());
    std::exit(1);
  }

  const auto configPath = program.get<std::string>("-c");

  if (!program.is_used("-c")) {
    SPDLOG_WARN("Config path not provided, using default: {}", configPath);
  }

  if (!fs::exists(configPath)) {
    SPDLOG_CRITICAL("Config file '{}' not found! Exiting.", configPath);
    std::exit(1);
  }

  const auto velocity = program.get<int>("--velocity");
  const auto acceleration = program.get<int>("--acceleration");
  if (velocity <= 0 || acceleration <= 0) {
    SPDLOG_CRITICAL("--velocity and --acceleration must be positive");
    std::exit(1);
  }

  std::stop_source stopSource;
  std::jthread signalWatcher([&stopSource](const std::stop_token& own) {
    while (!own.stop_requested()) {
      if (!running) {
        SPDLOG_WARN("Stop requested, cancelling at the next poll");
        stopSource.request_stop();
        return;
      }
      std::this_thread::sleep_for(50ms);
    }
  });

  try {
    Config::instance().setConfigPath(configPath);
    const auto settings = DriveSettings::fromConfig();
    auto homingMethod = settings.homingMethod;
    if (program.is_used("--homing")) {
      homingMethod = resolveHomingMethod(program.get<std::string>("--homing"));
    }
    const bool home = program.get<bool>("--home") || program.is_used("--homing");
    auto drive = DriveController::open(settings);

    OperationContext context{stopSource.get_token(),
                             [](const PollProgress& progress) {
                               SPDLOG_INFO("{}: waiting for {} ({} poll(s))",
                                           progress.label, progress.expectation,
                                           progress.attempt);
                             }};

    drive->init(context);
    YAML::Node report;
    report["start"] = drive->getStatus();
    if (home) {
      drive->setHoming(homingMethod, 600, 300, 1000, context);
      report["homingMethod"] = homingMethod;
      report["homed"] = drive->getStatus();
    }
    const auto status =
        drive->move(static_cast<std::uint32_t>(velocity),
                    static_cast<std::uint32_t>(acceleration),
                    program.get<int>("--target"), context);
    report["final"] = status;
    YAML::Emitter out;
    out << report;
    SPDLOG_INFO("Motion report:\n{}", out.c_str());
    drive->close();
  }
  catch (const OperationCancelled& e) {
    SPDLOG_WARN("{}", e.what());
    return 2;
  }
  catch (const std::exception& e) {
    SPDLOG_CRITICAL("{}", e.what());
    return 1;
  }

  return 0;
}
