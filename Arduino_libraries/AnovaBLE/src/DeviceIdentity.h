/******************************************************************************************************/
// DeviceIdentity
//
// Canonical BLE address (XX:XX:XX:XX:XX:XX, upper case) and display name of one cooker.
// An identity can only be created from an address that has exactly six hex octets.
/******************************************************************************************************/

#ifndef DEVICE_IDENTITY_H
#define DEVICE_IDENTITY_H

#include <string>

struct DeviceIdentity {
  std::string address;   // canonical form
  std::string name;

  // Validate and canonicalize; returns false (and leaves out untouched) on an invalid address.
  // An empty name is replaced by ANOVA_DEFAULT_DEVICE_NAME.
  static bool fromAddress(const std::string& rawAddress, const std::string& name, DeviceIdentity& out);

  bool operator==(const DeviceIdentity& other) const {
    return address == other.address && name == other.name;
  }
};

// Accepts ':', '-' and ' ' as separators and any letter case.
// Writes "AA:BB:CC:DD:EE:FF" into out. Idempotent on its own output.
bool canonicalAddress(const std::string& raw, std::string& out);

// True for the all-zero and the AA:BB:CC:DD:EE:FF example address
bool isPlaceholderAddress(const std::string& canonical);

// Name shown for a discovered device that advertises none ("Anova EE:FF")
std::string fallbackDeviceName(const std::string& canonical);

#endif // DEVICE_IDENTITY_H
