#include "adbtrack/adbtrack.h"
#include "internal.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace adbtrack {
namespace {

struct StatusToken {
  const char* token;
  DeviceStatus status;
};

// Accepted spellings of each status token (lowercase).
constexpr StatusToken kStatusTokens[] = {
    {"offline", DeviceStatus::kOffline},
    {"device", DeviceStatus::kDevice},
    {"unauthorized", DeviceStatus::kUnauthorized},
    {"authorizing", DeviceStatus::kAuthorizing},
    {"no-permissions", DeviceStatus::kNoPermissions},
    {"no_permissions", DeviceStatus::kNoPermissions},
    {"nopermissions", DeviceStatus::kNoPermissions},
    {"bootloader", DeviceStatus::kBootloader},
    {"recovery", DeviceStatus::kRecovery},
    {"unknown", DeviceStatus::kUnknown},
};

std::string ToLower(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace

namespace internal {

void Log(const Config::LogCallback& callback, LogLevel level,
         const std::string& message) {
  if (callback) {
    callback(level, message);
    return;
  }
  std::cerr << "[adbtrack] [" << LogLevelName(level) << "] " << message
            << std::endl;
}

void SetError(Error* error, ErrorCode code, const std::string& message) {
  if (error) {
    error->code = code;
    error->message = message;
  }
}

}  // namespace internal

bool operator==(const DeviceInfo& lhs, const DeviceInfo& rhs) {
  return lhs.id == rhs.id && lhs.status == rhs.status;
}

bool operator!=(const DeviceInfo& lhs, const DeviceInfo& rhs) {
  return !(lhs == rhs);
}

bool DeviceDiff::empty() const {
  return added.empty() && removed.empty() && changed.empty();
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (host.empty()) {
    return fail("host must not be empty");
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (max_payload_length == 0 || max_payload_length > kMaxFrameLength) {
    return fail("max_payload_length must be between 1 and 0xffff");
  }
  if (max_buffered_bytes < max_payload_length + kLengthPrefixSize) {
    return fail("max_buffered_bytes must hold at least one full frame");
  }
  return true;
}

const char* DeviceStatusName(DeviceStatus status) {
  switch (status) {
    case DeviceStatus::kOffline:
      return "offline";
    case DeviceStatus::kDevice:
      return "device";
    case DeviceStatus::kUnauthorized:
      return "unauthorized";
    case DeviceStatus::kAuthorizing:
      return "authorizing";
    case DeviceStatus::kNoPermissions:
      return "no-permissions";
    case DeviceStatus::kBootloader:
      return "bootloader";
    case DeviceStatus::kRecovery:
      return "recovery";
    case DeviceStatus::kUnknown:
      return "unknown";
  }
  return "unknown";
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kConnection:
      return "connection";
    case ErrorCode::kProtocol:
      return "protocol";
    case ErrorCode::kCommandFailed:
      return "command_failed";
    case ErrorCode::kInvalidState:
      return "invalid_state";
    case ErrorCode::kInvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kIdle:
      return "idle";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kHandshaking:
      return "handshaking";
    case ConnectionState::kTracking:
      return "tracking";
    case ConnectionState::kClosed:
      return "closed";
    case ConnectionState::kError:
      return "error";
  }
  return "unknown";
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

DeviceStatus ParseDeviceStatus(const std::string& token) {
  const std::string lowered = ToLower(token);
  for (const auto& entry : kStatusTokens) {
    if (lowered == entry.token) {
      return entry.status;
    }
  }
  return DeviceStatus::kUnknown;
}

bool EncodeCommand(const std::string& command, std::string* out,
                   Error* error) {
  if (command.size() > kMaxFrameLength) {
    std::ostringstream oss;
    oss << "command length " << command.size()
        << " exceeds protocol maximum of " << kMaxFrameLength << " bytes";
    internal::SetError(error, ErrorCode::kProtocol, oss.str());
    return false;
  }
  char prefix[kLengthPrefixSize + 1] = {0};
  std::snprintf(prefix, sizeof(prefix), "%04x",
                static_cast<unsigned int>(command.size()));
  if (out) {
    out->assign(prefix, kLengthPrefixSize);
    out->append(command);
  }
  return true;
}

bool DecodeLengthPrefix(const std::string& header, size_t* length) {
  if (header.size() != kLengthPrefixSize) {
    return false;
  }
  for (char c : header) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  const unsigned long value = std::strtoul(header.c_str(), nullptr, 16);
  if (length) {
    *length = static_cast<size_t>(value);
  }
  return true;
}

std::vector<DeviceInfo> DecodeDeviceList(const std::string& payload,
                                         std::vector<std::string>* rejected_lines) {
  std::vector<DeviceInfo> devices;
  std::istringstream lines(payload);
  std::string line;
  while (std::getline(lines, line, '\n')) {
    const std::string trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    std::istringstream fields(trimmed);
    std::vector<std::string> parts;
    std::string part;
    while (fields >> part) {
      parts.push_back(part);
    }
    if (parts.size() != 2) {
      if (rejected_lines) {
        rejected_lines->push_back(line);
      }
      continue;
    }
    DeviceInfo info;
    info.id = parts[0];
    info.status = ParseDeviceStatus(parts[1]);
    devices.push_back(std::move(info));
  }
  return devices;
}

}  // namespace adbtrack
