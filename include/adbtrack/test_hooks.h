#pragma once

#include "adbtrack/adbtrack.h"

#include <cstddef>
#include <vector>

namespace adbtrack {

#ifdef ADBTRACK_TESTING
namespace test {

// Deliver a roster to the tracker's devices listeners without a connection.
void EmitDevices(DeviceTracker& tracker, const std::vector<DeviceInfo>& devices);

// Total number of devices, error and close listeners registered.
size_t GetListenerCount(const DeviceTracker& tracker);

}  // namespace test
#endif

}  // namespace adbtrack
