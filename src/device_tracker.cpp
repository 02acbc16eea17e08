#include "adbtrack/adbtrack.h"
#include "adbtrack/test_hooks.h"
#include "internal.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace adbtrack {
namespace {

bool IsActive(ConnectionState state) {
  return state == ConnectionState::kConnecting ||
         state == ConnectionState::kHandshaking ||
         state == ConnectionState::kTracking;
}

bool IsTerminal(ConnectionState state) {
  return state == ConnectionState::kClosed || state == ConnectionState::kError;
}

}  // namespace

struct TrackerMetricsAtomic {
  std::atomic<uint64_t> frames_received{0};
  std::atomic<uint64_t> devices_decoded{0};
  std::atomic<uint64_t> malformed_lines{0};
  std::atomic<uint64_t> callback_exceptions{0};

  TrackerMetrics Snapshot() const {
    TrackerMetrics snapshot;
    snapshot.frames_received = frames_received.load();
    snapshot.devices_decoded = devices_decoded.load();
    snapshot.malformed_lines = malformed_lines.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

// Owned jointly by the public DeviceTracker and the read thread, so a listener
// running on the read thread may destroy the tracker.
struct DeviceTracker::Impl : std::enable_shared_from_this<DeviceTracker::Impl> {
  explicit Impl(Config config) : config_(std::move(config)) {}

  ~Impl() { Shutdown(); }

  // Stop tracking and join the read thread, or detach it when called from
  // that thread.
  void Shutdown() {
    Stop();
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (loop_thread_.joinable()) {
      if (loop_thread_.get_id() == std::this_thread::get_id()) {
        loop_thread_.detach();
      } else {
        loop_thread_.join();
      }
    }
  }

  bool Start(Error* error) {
    std::shared_ptr<Transport> transport;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (IsActive(state_)) {
        Log(LogLevel::kWarning, "Device tracking is already in progress.");
        return true;
      }
      if (IsTerminal(state_)) {
        internal::SetError(error, ErrorCode::kInvalidState,
                           "tracker is closed; construct a new DeviceTracker to retry");
        return false;
      }
      std::string config_error;
      if (!config_.Validate(&config_error)) {
        last_error_ = {ErrorCode::kInvalidConfig, config_error};
        Log(LogLevel::kError, "Invalid configuration: " + config_error);
        internal::SetError(error, ErrorCode::kInvalidConfig, config_error);
        return false;
      }
      transport = std::make_shared<Transport>(config_);
      transport_ = transport;
      state_ = ConnectionState::kConnecting;
    }

    Error step_error;
    if (!transport->Connect(&step_error)) {
      return FailStart(step_error, error);
    }
    SetState(ConnectionState::kHandshaking);
    if (!transport->SendCommand(kTrackDevicesCommand, &step_error)) {
      return FailStart(step_error, error);
    }
    Log(LogLevel::kInfo, "Successfully started device tracking");
    Log(LogLevel::kInfo, "Listening for device status changes...");

    std::string payload;
    if (!transport->ReadLengthPrefixed(&payload, &step_error)) {
      return FailStart(step_error, error);
    }
    SetState(ConnectionState::kTracking);
    HandleFrame(payload);

    try {
      std::lock_guard<std::mutex> lock(thread_mutex_);
      loop_thread_ = std::thread([self = shared_from_this()]() { self->ReadLoop(); });
    } catch (const std::exception& ex) {
      step_error = {ErrorCode::kConnection,
                    std::string("read thread start failed: ") + ex.what()};
      return FailStart(step_error, error);
    }
    return true;
  }

  void Stop() {
    std::shared_ptr<Transport> transport;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (!IsActive(state_)) {
        return;
      }
      stop_requested_ = true;
      transport = transport_;
    }
    Log(LogLevel::kInfo, "Stopping device tracking");
    if (transport) {
      transport->Disconnect();
    }
  }

  ListenerId AddDevicesListener(DevicesCallback cb) {
    const ListenerId id = next_listener_id_.fetch_add(1);
    devices_listeners_.Add(id, std::move(cb));
    return id;
  }

  ListenerId AddErrorListener(ErrorCallback cb) {
    const ListenerId id = next_listener_id_.fetch_add(1);
    error_listeners_.Add(id, std::move(cb));
    return id;
  }

  ListenerId AddCloseListener(CloseCallback cb) {
    const ListenerId id = next_listener_id_.fetch_add(1);
    close_listeners_.Add(id, std::move(cb));
    return id;
  }

  bool RemoveListener(ListenerId id) {
    return devices_listeners_.Remove(id) || error_listeners_.Remove(id) ||
           close_listeners_.Remove(id);
  }

  ConnectionState GetState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
  }

  bool WaitForClose(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    // Nothing to wait for until Start() leaves kIdle.
    auto done = [this]() {
      return closed_notified_ || state_ == ConnectionState::kIdle;
    };
    if (timeout == std::chrono::milliseconds::max()) {
      state_cv_.wait(lock, done);
    } else {
      state_cv_.wait_for(lock, timeout, done);
    }
    return closed_notified_;
  }

  Error GetLastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
  }

  TrackerMetrics GetMetrics() const { return metrics_.Snapshot(); }

  // Decode one roster payload and deliver it to devices listeners.
  void HandleFrame(const std::string& payload) {
    metrics_.frames_received.fetch_add(1);
    std::vector<std::string> rejected;
    const std::vector<DeviceInfo> devices = DecodeDeviceList(payload, &rejected);
    for (const auto& line : rejected) {
      metrics_.malformed_lines.fetch_add(1);
      Log(LogLevel::kWarning, "Unexpected device line format: " + line);
    }
    metrics_.devices_decoded.fetch_add(devices.size());
    std::ostringstream oss;
    oss << "Received device list with " << devices.size() << " entries";
    Log(LogLevel::kInfo, oss.str());
    EmitDevices(devices);
  }

  void EmitDevices(const std::vector<DeviceInfo>& devices) {
    metrics_.callback_exceptions.fetch_add(
        devices_listeners_.Emit("DevicesCallback", config_.log_callback, devices));
  }

  size_t ListenerCount() const {
    return devices_listeners_.size() + error_listeners_.size() +
           close_listeners_.size();
  }

 private:
  void Log(LogLevel level, const std::string& message) const {
    internal::Log(config_.log_callback, level, message);
  }

  void SetState(ConnectionState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (IsActive(state_)) {
      state_ = state;
    }
  }

  // Tear down after a failed handshake step. A failure caused by Stop() closes
  // quietly; anything else surfaces an error event first.
  bool FailStart(const Error& step_error, Error* error) {
    Log(LogLevel::kError, std::string("Error in DeviceTracker start: ") +
                              ErrorCodeName(step_error.code) + ": " +
                              step_error.message);
    Finish(step_error, !stop_requested_);
    internal::SetError(error, step_error.code, step_error.message);
    return false;
  }

  // Read roster frames until the transport closes or Stop() is called.
  void ReadLoop() {
    std::shared_ptr<Transport> transport;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      transport = transport_;
    }
    Error read_error;
    bool failed = false;
    bool header_read = false;
    while (!stop_requested_) {
      std::string payload;
      if (!transport->ReadLengthPrefixed(&payload, &read_error, &header_read)) {
        failed = true;
        break;
      }
      HandleFrame(payload);
    }

    bool report = false;
    if (failed && !stop_requested_) {
      report = true;
      if (read_error.code == ErrorCode::kConnection && !header_read) {
        // A server-side close before any byte of the next frame is a clean
        // end of tracking.
        Error close_error;
        if (transport->WaitForClose(&close_error) &&
            transport->BufferedBytes() == 0) {
          report = false;
          Log(LogLevel::kInfo, "ADB server closed the tracking connection");
        }
      }
      if (report) {
        Log(LogLevel::kError, std::string("Error reading device data: ") +
                                  ErrorCodeName(read_error.code) + ": " +
                                  read_error.message);
      }
    }
    Finish(read_error, report);
  }

  // Disconnect, settle into a terminal state and notify listeners.
  void Finish(const Error& cause, bool report) {
    std::shared_ptr<Transport> transport;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      transport = transport_;
      state_ = report ? ConnectionState::kError : ConnectionState::kClosed;
      if (report) {
        last_error_ = cause;
      }
    }
    if (transport) {
      transport->Disconnect();
    }
    if (report) {
      metrics_.callback_exceptions.fetch_add(
          error_listeners_.Emit("ErrorCallback", config_.log_callback, cause));
    }
    Log(LogLevel::kInfo, "Device tracking stopped.");
    metrics_.callback_exceptions.fetch_add(
        close_listeners_.Emit("CloseCallback", config_.log_callback));
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      closed_notified_ = true;
    }
    state_cv_.notify_all();
  }

  Config config_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> next_listener_id_{1};
  TrackerMetricsAtomic metrics_;

  internal::ListenerRegistry<const std::vector<DeviceInfo>&> devices_listeners_;
  internal::ListenerRegistry<const Error&> error_listeners_;
  internal::ListenerRegistry<> close_listeners_;

  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  ConnectionState state_ = ConnectionState::kIdle;
  bool closed_notified_ = false;
  Error last_error_;
  std::shared_ptr<Transport> transport_;

  std::mutex thread_mutex_;
  std::thread loop_thread_;
};

DeviceTracker::DeviceTracker(Config config)
    : impl_(std::make_shared<Impl>(std::move(config))) {}

DeviceTracker::~DeviceTracker() { impl_->Shutdown(); }

bool DeviceTracker::Start(Error* error) {
  // A listener fired from a failed start may destroy this tracker.
  std::shared_ptr<Impl> impl = impl_;
  return impl->Start(error);
}
void DeviceTracker::Stop() { impl_->Stop(); }

DeviceTracker::ListenerId DeviceTracker::AddDevicesListener(DevicesCallback cb) {
  return impl_->AddDevicesListener(std::move(cb));
}

DeviceTracker::ListenerId DeviceTracker::AddErrorListener(ErrorCallback cb) {
  return impl_->AddErrorListener(std::move(cb));
}

DeviceTracker::ListenerId DeviceTracker::AddCloseListener(CloseCallback cb) {
  return impl_->AddCloseListener(std::move(cb));
}

bool DeviceTracker::RemoveListener(ListenerId id) {
  return impl_->RemoveListener(id);
}

ConnectionState DeviceTracker::GetState() const { return impl_->GetState(); }

bool DeviceTracker::IsTracking() const {
  return impl_->GetState() == ConnectionState::kTracking;
}

bool DeviceTracker::WaitForClose(std::chrono::milliseconds timeout) {
  return impl_->WaitForClose(timeout);
}

Error DeviceTracker::GetLastError() const { return impl_->GetLastError(); }

TrackerMetrics DeviceTracker::GetMetrics() const { return impl_->GetMetrics(); }

#ifdef ADBTRACK_TESTING
namespace test {

void EmitDevices(DeviceTracker& tracker, const std::vector<DeviceInfo>& devices) {
  tracker.impl_->EmitDevices(devices);
}

size_t GetListenerCount(const DeviceTracker& tracker) {
  return tracker.impl_->ListenerCount();
}

}  // namespace test
#endif

}  // namespace adbtrack
