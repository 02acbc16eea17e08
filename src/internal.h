#pragma once

#include "adbtrack/adbtrack.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace adbtrack {
namespace internal {

// Route a message to the configured callback, or stderr when none is set.
void Log(const Config::LogCallback& callback, LogLevel level,
         const std::string& message);

// Fill an optional Error out-parameter.
void SetError(Error* error, ErrorCode code, const std::string& message);

// Thread-safe set of listeners keyed by id. Emit() invokes each callback
// outside the lock, so listeners may add or remove listeners (or stop the
// emitter) from inside a callback. Remove() blocks until invocations of that
// listener running on other threads have returned; once it returns the
// callback is never entered again.
template <typename... Args>
class ListenerRegistry {
 public:
  using Callback = std::function<void(Args...)>;

  void Add(uint64_t id, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_[id] = std::move(cb);
  }

  bool Remove(uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (listeners_.erase(id) == 0) {
      return false;
    }
    const std::thread::id self = std::this_thread::get_id();
    idle_cv_.wait(lock, [&]() {
      return std::none_of(running_.begin(), running_.end(),
                          [&](const Invocation& call) {
                            return call.first == id && call.second != self;
                          });
    });
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
  }

  // Returns the number of listeners that threw.
  uint64_t Emit(const char* name, const Config::LogCallback& log, Args... args) {
    std::vector<uint64_t> ids;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ids.reserve(listeners_.size());
      for (const auto& entry : listeners_) {
        ids.push_back(entry.first);
      }
    }
    const std::thread::id self = std::this_thread::get_id();
    uint64_t failures = 0;
    for (uint64_t id : ids) {
      Callback cb;
      const Invocation current(id, self);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(id);
        if (it == listeners_.end() || !it->second) {
          continue;
        }
        cb = it->second;
        running_.push_back(current);
      }
      try {
        cb(args...);
      } catch (const std::exception& ex) {
        ++failures;
        Log(log, LogLevel::kError,
            std::string(name) + " listener threw exception: " + ex.what());
      } catch (...) {
        ++failures;
        Log(log, LogLevel::kError,
            std::string(name) + " listener threw unknown exception");
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(running_.begin(), running_.end(), current);
        if (it != running_.end()) {
          running_.erase(it);
        }
      }
      idle_cv_.notify_all();
    }
    return failures;
  }

 private:
  using Invocation = std::pair<uint64_t, std::thread::id>;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::map<uint64_t, Callback> listeners_;
  std::vector<Invocation> running_;
};

}  // namespace internal
}  // namespace adbtrack
