#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace adbtrack {

class DeviceTracker;

struct DeviceInfo;

#ifdef ADBTRACK_TESTING
namespace test {
void EmitDevices(DeviceTracker& tracker,
                 const std::vector<DeviceInfo>& devices);
size_t GetListenerCount(const DeviceTracker& tracker);
}  // namespace test
#endif

/**
 * Default ADB server endpoint.
 */
constexpr const char* kDefaultHost = "127.0.0.1";
constexpr uint16_t kDefaultPort = 5037;

/**
 * Wire constants for the ADB smart-socket protocol.
 */
constexpr size_t kLengthPrefixSize = 4;
constexpr size_t kStatusTokenSize = 4;
constexpr size_t kMaxFrameLength = 0xffff;
constexpr const char* kOkayToken = "OKAY";
constexpr const char* kFailToken = "FAIL";
constexpr const char* kTrackDevicesCommand = "host:track-devices";

/**
 * Connection state reported by the ADB server for each device.
 */
enum class DeviceStatus {
  kOffline,
  kDevice,
  kUnauthorized,
  kAuthorizing,
  kNoPermissions,
  kBootloader,
  kRecovery,
  kUnknown,
};

/**
 * One entry of a device roster.
 */
struct DeviceInfo {
  /// Serial reported by the server (opaque, whitespace-free).
  std::string id;
  /// Connection state reported for this serial.
  DeviceStatus status = DeviceStatus::kUnknown;
};

bool operator==(const DeviceInfo& lhs, const DeviceInfo& rhs);
bool operator!=(const DeviceInfo& lhs, const DeviceInfo& rhs);

/**
 * A device whose status differs between two rosters.
 */
struct DeviceChange {
  /// The device as it appears in the newer roster.
  DeviceInfo device;
  DeviceStatus old_status = DeviceStatus::kUnknown;
  DeviceStatus new_status = DeviceStatus::kUnknown;
};

/**
 * Delta between two successive rosters, keyed by device id.
 */
struct DeviceDiff {
  std::vector<DeviceInfo> added;
  std::vector<DeviceInfo> removed;
  std::vector<DeviceChange> changed;

  /// True when nothing was added, removed or changed.
  bool empty() const;
};

/**
 * Error categories reported by transport and tracker operations.
 */
enum class ErrorCode {
  kNone,
  /// The stream could not be opened or died mid-read.
  kConnection,
  /// Unrecognized status token or an implausible frame length.
  kProtocol,
  /// The server answered a request with FAIL.
  kCommandFailed,
  /// Operation not allowed in the current state.
  kInvalidState,
  /// Configuration failed validation.
  kInvalidConfig,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

/**
 * Lifecycle of a tracking session. kClosed and kError are terminal.
 */
enum class ConnectionState {
  kIdle,
  kConnecting,
  kHandshaking,
  kTracking,
  kClosed,
  kError,
};

enum class LogLevel {
  kInfo,
  kWarning,
  kError,
};

/**
 * Lightweight counters for frame flow and error reporting.
 */
struct TrackerMetrics {
  uint64_t frames_received = 0;
  uint64_t devices_decoded = 0;
  uint64_t malformed_lines = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Connection and protocol configuration shared by Transport and DeviceTracker.
 */
struct Config {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  /// ADB server host name or address.
  std::string host = kDefaultHost;
  /// ADB server TCP port.
  uint16_t port = kDefaultPort;

  /// Largest roster payload accepted before treating the frame as a protocol error.
  size_t max_payload_length = kMaxFrameLength;
  /// Cap on bytes retained in the receive buffer. Reaching it pauses the
  /// receive thread until readers consume data.
  size_t max_buffered_bytes = 1 << 20;

  /// If true, consume the length-prefixed reason the server sends after FAIL.
  bool read_failure_reason = false;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

const char* DeviceStatusName(DeviceStatus status);
const char* ErrorCodeName(ErrorCode code);
const char* ConnectionStateName(ConnectionState state);
const char* LogLevelName(LogLevel level);

/**
 * Map a status token to DeviceStatus, case-insensitively.
 * Unrecognized tokens map to kUnknown.
 */
DeviceStatus ParseDeviceStatus(const std::string& token);

/**
 * Frame a request as <4 lowercase hex digits><text>.
 *
 * @return false with kProtocol if the text is longer than kMaxFrameLength bytes.
 */
bool EncodeCommand(const std::string& command, std::string* out,
                   Error* error = nullptr);

/**
 * Parse a 4-hex-digit length header into a byte count.
 *
 * @return false if the header is not exactly four hex digits.
 */
bool DecodeLengthPrefix(const std::string& header, size_t* length);

/**
 * Decode a roster payload into device records.
 *
 * Lines are trimmed, blank lines skipped and each remaining line must split
 * into exactly two whitespace-separated tokens. Other lines are dropped and,
 * if rejected_lines is given, appended to it.
 */
std::vector<DeviceInfo> DecodeDeviceList(
    const std::string& payload,
    std::vector<std::string>* rejected_lines = nullptr);

/**
 * Compute added/removed/changed between two rosters. When an id repeats
 * within one roster the last occurrence wins.
 */
DeviceDiff ComputeDeviceDiff(const std::vector<DeviceInfo>& previous,
                             const std::vector<DeviceInfo>& current);

/**
 * One TCP connection to the ADB server with a buffered exact-read primitive.
 *
 * Incoming bytes are appended to an internal buffer by a receive thread.
 * Readers are served in FIFO order and never see a short read. When the
 * buffer holds Config::max_buffered_bytes the receive thread stops reading
 * from the socket until a reader drains it.
 */
class Transport {
 public:
  explicit Transport(Config config);
  /// Disconnect and join the receive thread.
  ~Transport();

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  /// Open the stream. No-op if already connected.
  bool Connect(Error* error = nullptr);
  /**
   * Block until exactly n bytes are available and consume them.
   * n may not exceed Config::max_buffered_bytes.
   */
  bool ReadExactBytes(size_t n, std::string* out, Error* error = nullptr);
  /**
   * Read one <4 hex length><payload> frame.
   *
   * @param header_read Optional; set to true once the length header has been
   *                    consumed, so a failure can be told apart from a close
   *                    at a frame boundary.
   */
  bool ReadLengthPrefixed(std::string* payload, Error* error = nullptr,
                          bool* header_read = nullptr);
  /// Send a framed request and check the 4-byte status token.
  bool SendCommand(const std::string& command, Error* error = nullptr);
  bool IsConnected() const;
  /// Close the stream. Pending and future reads fail. Idempotent.
  void Disconnect();
  /**
   * Block until the stream closes.
   *
   * @return false with the terminal error if the stream ended abnormally.
   */
  bool WaitForClose(Error* error = nullptr);
  /// Number of received bytes not yet consumed by a reader.
  size_t BufferedBytes() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Long-lived "track devices" session.
 *
 * Start() connects, performs the handshake and delivers the initial roster
 * before returning; a background thread then delivers every subsequent
 * roster frame. A tracker is single-use: once closed it cannot be restarted.
 */
class DeviceTracker {
 public:
  using ListenerId = uint64_t;
  using DevicesCallback = std::function<void(const std::vector<DeviceInfo>&)>;
  using ErrorCallback = std::function<void(const Error&)>;
  using CloseCallback = std::function<void()>;

  explicit DeviceTracker(Config config);
  /// Stop tracking and join the read thread. May be called from a listener.
  ~DeviceTracker();

  DeviceTracker(const DeviceTracker&) = delete;
  DeviceTracker& operator=(const DeviceTracker&) = delete;

  /// Connect, handshake, deliver the initial roster and start the read loop.
  bool Start(Error* error = nullptr);
  /// Sever the connection. Does not emit an error event.
  void Stop();

  /// Register a listener for every decoded roster.
  ListenerId AddDevicesListener(DevicesCallback cb);
  /// Register a listener for transport or protocol errors.
  ListenerId AddErrorListener(ErrorCallback cb);
  /// Register a listener invoked once when tracking ends.
  ListenerId AddCloseListener(CloseCallback cb);
  /**
   * Remove any listener by id. Blocks until a running invocation of that
   * listener on another thread returns.
   *
   * @return false if the id is unknown.
   */
  bool RemoveListener(ListenerId id);

  ConnectionState GetState() const;
  bool IsTracking() const;
  /**
   * Block until the session reaches kClosed or kError.
   *
   * @return false if the timeout elapsed first, or at once if the tracker
   *         was never started (including a Start() rejected for its config).
   */
  bool WaitForClose(std::chrono::milliseconds timeout =
                        std::chrono::milliseconds::max());
  /// Return the last start or read-loop error, if any.
  Error GetLastError() const;
  TrackerMetrics GetMetrics() const;

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;

#ifdef ADBTRACK_TESTING
  friend void test::EmitDevices(DeviceTracker& tracker,
                                const std::vector<DeviceInfo>& devices);
  friend size_t test::GetListenerCount(const DeviceTracker& tracker);
#endif
};

/**
 * Authoritative device roster maintained from tracker emissions.
 *
 * Readers always see a complete snapshot; each new roster replaces the
 * previous one under a lock.
 */
class DeviceSet {
 public:
  using ListenerId = uint64_t;
  using ChangeCallback = std::function<void(const DeviceDiff&)>;

  DeviceSet();
  explicit DeviceSet(Config::LogCallback log_callback);
  /// Unsubscribe from the tracker, if any.
  ~DeviceSet();

  DeviceSet(const DeviceSet&) = delete;
  DeviceSet& operator=(const DeviceSet&) = delete;

  /**
   * Attach to a tracker's roster emissions. The tracker must outlive the
   * subscription. Replaces any previous subscription.
   */
  void Subscribe(DeviceTracker& tracker);
  /// Detach from the tracker. Waits for a roster being applied on the
  /// tracker's thread to finish.
  void Unsubscribe();
  bool IsSubscribed() const;

  /// Fold a roster into the authoritative set and return the diff.
  DeviceDiff Apply(const std::vector<DeviceInfo>& devices);

  /// Register a listener for every non-empty diff.
  ListenerId AddChangeListener(ChangeCallback cb);
  bool RemoveListener(ListenerId id);

  /// Return the authoritative roster.
  std::vector<DeviceInfo> GetDevices() const;
  /// Return the devices whose status is kDevice, in roster order.
  std::vector<DeviceInfo> GetConnectedDevices() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace adbtrack
