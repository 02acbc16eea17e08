#include "adbtrack/adbtrack.h"
#include "internal.h"

#include <atomic>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace adbtrack {
namespace {

// Unique ids in first-occurrence order; the last occurrence supplies the value.
struct RosterIndex {
  std::vector<std::string> order;
  std::unordered_map<std::string, DeviceInfo> by_id;
};

RosterIndex IndexRoster(const std::vector<DeviceInfo>& devices) {
  RosterIndex index;
  for (const auto& device : devices) {
    auto it = index.by_id.find(device.id);
    if (it == index.by_id.end()) {
      index.order.push_back(device.id);
      index.by_id.emplace(device.id, device);
    } else {
      it->second = device;
    }
  }
  return index;
}

// Survivors keep their previous order, followed by added then changed devices.
std::vector<DeviceInfo> MergeRoster(const std::vector<DeviceInfo>& previous,
                                    const DeviceDiff& diff) {
  std::unordered_set<std::string> replaced;
  for (const auto& device : diff.removed) {
    replaced.insert(device.id);
  }
  for (const auto& change : diff.changed) {
    replaced.insert(change.device.id);
  }
  std::vector<DeviceInfo> merged;
  merged.reserve(previous.size() + diff.added.size());
  for (const auto& device : previous) {
    if (replaced.count(device.id) == 0) {
      merged.push_back(device);
    }
  }
  merged.insert(merged.end(), diff.added.begin(), diff.added.end());
  for (const auto& change : diff.changed) {
    merged.push_back(change.device);
  }
  return merged;
}

std::string Summarize(const DeviceDiff& diff) {
  std::ostringstream oss;
  oss << "added=[";
  for (size_t i = 0; i < diff.added.size(); ++i) {
    oss << (i ? ", " : "") << diff.added[i].id << " ("
        << DeviceStatusName(diff.added[i].status) << ")";
  }
  oss << "] removed=[";
  for (size_t i = 0; i < diff.removed.size(); ++i) {
    oss << (i ? ", " : "") << diff.removed[i].id;
  }
  oss << "] changed=[";
  for (size_t i = 0; i < diff.changed.size(); ++i) {
    const auto& change = diff.changed[i];
    oss << (i ? ", " : "") << change.device.id << " ("
        << DeviceStatusName(change.old_status) << " -> "
        << DeviceStatusName(change.new_status) << ")";
  }
  oss << "]";
  return oss.str();
}

}  // namespace

DeviceDiff ComputeDeviceDiff(const std::vector<DeviceInfo>& previous,
                             const std::vector<DeviceInfo>& current) {
  const RosterIndex old_index = IndexRoster(previous);
  const RosterIndex new_index = IndexRoster(current);

  DeviceDiff diff;
  for (const auto& id : new_index.order) {
    const DeviceInfo& device = new_index.by_id.at(id);
    auto old_it = old_index.by_id.find(id);
    if (old_it == old_index.by_id.end()) {
      diff.added.push_back(device);
    } else if (old_it->second.status != device.status) {
      DeviceChange change;
      change.device = device;
      change.old_status = old_it->second.status;
      change.new_status = device.status;
      diff.changed.push_back(change);
    }
  }
  for (const auto& id : old_index.order) {
    if (new_index.by_id.count(id) == 0) {
      diff.removed.push_back(old_index.by_id.at(id));
    }
  }
  return diff;
}

struct DeviceSet::Impl {
  explicit Impl(Config::LogCallback log) : log_callback_(std::move(log)) {}

  void Subscribe(DeviceTracker& tracker) {
    Unsubscribe();
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    subscription_id_ = tracker.AddDevicesListener(
        [this](const std::vector<DeviceInfo>& devices) { Apply(devices); });
    tracker_ = &tracker;
  }

  // Waits for an Apply() already running on the tracker's thread to return.
  void Unsubscribe() {
    DeviceTracker* tracker = nullptr;
    DeviceTracker::ListenerId id = 0;
    {
      std::lock_guard<std::mutex> lock(subscription_mutex_);
      std::swap(tracker, tracker_);
      std::swap(id, subscription_id_);
    }
    if (tracker) {
      tracker->RemoveListener(id);
    }
  }

  bool IsSubscribed() const {
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    return tracker_ != nullptr;
  }

  DeviceDiff Apply(const std::vector<DeviceInfo>& devices) {
    // Serializes diffs so listeners observe rosters in arrival order.
    std::lock_guard<std::mutex> apply_lock(apply_mutex_);
    std::vector<DeviceInfo> previous;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      previous = devices_;
    }
    DeviceDiff diff = ComputeDeviceDiff(previous, devices);
    std::vector<DeviceInfo> merged = MergeRoster(previous, diff);
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      devices_.swap(merged);
    }
    if (!diff.empty()) {
      internal::Log(log_callback_, LogLevel::kInfo,
                    "Device changes detected: " + Summarize(diff));
      change_listeners_.Emit("ChangeCallback", log_callback_, diff);
    }
    return diff;
  }

  ListenerId AddChangeListener(ChangeCallback cb) {
    const ListenerId id = next_listener_id_.fetch_add(1);
    change_listeners_.Add(id, std::move(cb));
    return id;
  }

  bool RemoveListener(ListenerId id) { return change_listeners_.Remove(id); }

  std::vector<DeviceInfo> GetDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_;
  }

  std::vector<DeviceInfo> GetConnectedDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<DeviceInfo> result;
    for (const auto& device : devices_) {
      if (device.status == DeviceStatus::kDevice) {
        result.push_back(device);
      }
    }
    return result;
  }

 private:
  Config::LogCallback log_callback_;
  internal::ListenerRegistry<const DeviceDiff&> change_listeners_;
  std::atomic<uint64_t> next_listener_id_{1};

  mutable std::mutex subscription_mutex_;
  DeviceTracker* tracker_ = nullptr;
  DeviceTracker::ListenerId subscription_id_ = 0;

  std::mutex apply_mutex_;
  mutable std::mutex devices_mutex_;
  std::vector<DeviceInfo> devices_;
};

DeviceSet::DeviceSet() : impl_(new Impl(nullptr)) {}

DeviceSet::DeviceSet(Config::LogCallback log_callback)
    : impl_(new Impl(std::move(log_callback))) {}

DeviceSet::~DeviceSet() { impl_->Unsubscribe(); }

void DeviceSet::Subscribe(DeviceTracker& tracker) { impl_->Subscribe(tracker); }
void DeviceSet::Unsubscribe() { impl_->Unsubscribe(); }
bool DeviceSet::IsSubscribed() const { return impl_->IsSubscribed(); }

DeviceDiff DeviceSet::Apply(const std::vector<DeviceInfo>& devices) {
  return impl_->Apply(devices);
}

DeviceSet::ListenerId DeviceSet::AddChangeListener(ChangeCallback cb) {
  return impl_->AddChangeListener(std::move(cb));
}

bool DeviceSet::RemoveListener(ListenerId id) {
  return impl_->RemoveListener(id);
}

std::vector<DeviceInfo> DeviceSet::GetDevices() const {
  return impl_->GetDevices();
}

std::vector<DeviceInfo> DeviceSet::GetConnectedDevices() const {
  return impl_->GetConnectedDevices();
}

}  // namespace adbtrack
