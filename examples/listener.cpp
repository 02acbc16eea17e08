// Example: track devices attached to the local ADB server and print changes.
#include "adbtrack/adbtrack.h"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {

std::mutex g_output_mutex;

void PrintUsage() {
  std::cout << "Usage: adbtrack_listener [--host <host>] [--port <port>] "
               "[--connected-only] [--fail-reason]\n";
}

bool ParsePort(const std::string& text, uint16_t* out) {
  char* end = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value == 0 || value > 0xffff) {
    return false;
  }
  *out = static_cast<uint16_t>(value);
  return true;
}

void PrintRoster(const std::vector<adbtrack::DeviceInfo>& devices) {
  if (devices.empty()) {
    std::cout << "  (no devices)" << std::endl;
    return;
  }
  for (const auto& device : devices) {
    std::cout << "  " << device.id << "\t" << adbtrack::DeviceStatusName(device.status)
              << std::endl;
  }
}

}  // namespace

int main(int argc, char** argv) {
  adbtrack::Config config;
  bool connected_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    }
    if (arg == "--connected-only") {
      connected_only = true;
      continue;
    }
    if (arg == "--fail-reason") {
      config.read_failure_reason = true;
      continue;
    }
    if ((arg == "--host" || arg == "--port") && i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << "\n";
      PrintUsage();
      return 1;
    }
    if (arg == "--host") {
      config.host = argv[++i];
    } else if (arg == "--port") {
      if (!ParsePort(argv[++i], &config.port)) {
        std::cerr << "Invalid port: " << argv[i] << "\n";
        return 1;
      }
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }

  std::string config_error;
  if (!config.Validate(&config_error)) {
    std::cerr << "Invalid configuration: " << config_error << std::endl;
    return 1;
  }

  adbtrack::DeviceTracker tracker(config);
  adbtrack::DeviceSet devices(config.log_callback);
  devices.Subscribe(tracker);

  devices.AddChangeListener([&](const adbtrack::DeviceDiff& diff) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    for (const auto& device : diff.added) {
      std::cout << "+ " << device.id << " " << adbtrack::DeviceStatusName(device.status)
                << std::endl;
    }
    for (const auto& device : diff.removed) {
      std::cout << "- " << device.id << std::endl;
    }
    for (const auto& change : diff.changed) {
      std::cout << "~ " << change.device.id << " "
                << adbtrack::DeviceStatusName(change.old_status) << " -> "
                << adbtrack::DeviceStatusName(change.new_status) << std::endl;
    }
    std::cout << (connected_only ? "Connected devices:" : "Devices:") << std::endl;
    PrintRoster(connected_only ? devices.GetConnectedDevices() : devices.GetDevices());
  });
  tracker.AddErrorListener([](const adbtrack::Error& error) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << "Tracking error (" << adbtrack::ErrorCodeName(error.code)
              << "): " << error.message << std::endl;
  });
  tracker.AddCloseListener([]() {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "Tracking session closed." << std::endl;
  });

  adbtrack::Error error;
  if (!tracker.Start(&error)) {
    std::cerr << "Failed to start tracking: " << error.message << std::endl;
    if (error.code == adbtrack::ErrorCode::kConnection) {
      std::cerr << "Start the server with 'adb start-server' and try again." << std::endl;
    }
    return 1;
  }
  {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "Tracking devices on " << config.host << ":" << config.port
              << ". Press Enter to stop." << std::endl;
  }
  std::string line;
  std::getline(std::cin, line);
  tracker.Stop();
  tracker.WaitForClose();
  devices.Unsubscribe();

  const auto metrics = tracker.GetMetrics();
  std::cout << "Frames received: " << metrics.frames_received
            << ", malformed lines: " << metrics.malformed_lines << std::endl;
  return tracker.GetState() == adbtrack::ConnectionState::kError ? 1 : 0;
}
