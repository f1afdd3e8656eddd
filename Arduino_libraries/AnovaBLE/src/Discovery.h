/******************************************************************************************************/
// Discovery
//
// One-shot scan for cookers. A peripheral qualifies when its advertised name contains "anova"
// (any case) or it advertises the Anova service UUID. Nothing is remembered between scans.
/******************************************************************************************************/

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <stdint.h>
#include <string>
#include <vector>

#include "BleTransport.h"
#include "DeviceIdentity.h"

namespace Discovery
{
  std::vector<DeviceIdentity> discoverDevices(BleTransport& transport, uint32_t timeoutMs);

  // Classification of a single scan result
  bool isCandidate(const BlePeripheral& p);

  // Filter a scan result list; entries with an invalid address are skipped
  std::vector<DeviceIdentity> filterCandidates(const std::vector<BlePeripheral>& peripherals);

  // Case-insensitive UUID equality, 16-bit forms ("ffe0", "0xFFE0") are expanded with the
  // Bluetooth base UUID first
  bool sameUuid(const std::string& a, const std::string& b);

} // namespace Discovery

#endif // DISCOVERY_H
