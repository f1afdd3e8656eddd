/******************************************************************************************************/
// Configuration for the AnovaBLE library
//
// GATT identifiers, command strings and the timing defaults used by the
// connection manager, the command serializer and the response accumulator.
/******************************************************************************************************/

#ifndef ANOVA_CONFIG_H
#define ANOVA_CONFIG_H

#include <stdint.h>

/******************************************************************************************************/
/* Definitions */
/******************************************************************************************************/
#define ANOVA_BLE_VERSION_STRING "AnovaBLE Library v1.0.0"

// Anova Precision Cooker A2/A3 (HM-10 style serial service)
static constexpr const char     ANOVA_SERVICE_UUID[]            = {"0000ffe0-0000-1000-8000-00805f9b34fb"};
static constexpr const char     ANOVA_CHARACTERISTIC_UUID[]     = {"0000ffe1-0000-1000-8000-00805f9b34fb"};
static constexpr const char     ANOVA_DEVICE_NAME_PREFIX[]      = {"Anova"};
static constexpr const char     ANOVA_DEFAULT_DEVICE_NAME[]     = {"Anova Precision Cooker"};

// Commands, every command is terminated by a carriage return
static constexpr const char     CMD_READ_UNIT[]                 = {"read unit\r"};
static constexpr const char     CMD_GET_STATUS[]                = {"status\r"};
static constexpr const char     CMD_READ_TARGET_TEMP[]          = {"read set temp\r"};
static constexpr const char     CMD_READ_CURRENT_TEMP[]         = {"read temp\r"};
static constexpr const char     CMD_SET_TEMP[]                  = {"set temp "};
static constexpr const char     CMD_SET_TIMER[]                 = {"set timer "};
static constexpr const char     CMD_START[]                     = {"start\r"};
static constexpr const char     CMD_STOP[]                      = {"stop\r"};
static constexpr const char     CMD_UNITS_C[]                   = {"set units C\r"};
static constexpr const char     CMD_UNITS_F[]                   = {"set units F\r"};
static constexpr const char     CMD_TERMINATOR[]                = {"\r"};

// ===== Connection =====
inline constexpr uint8_t        CONNECT_ATTEMPTS                =     3;
inline constexpr uint32_t       CONNECT_TIMEOUT_MS              = 10000;    // per attempt
inline constexpr uint32_t       CONNECT_TIMEOUT_FLOOR_MS        = 10000;    // the BLE stack needs at least this long
inline constexpr uint32_t       CONNECT_BACKOFF_MS              =  2000;    // wait between failed attempts
inline constexpr uint32_t       LOOKUP_TIMEOUT_MS               =  2000;    // directed lookup before connecting
inline constexpr uint32_t       FALLBACK_SCAN_TIMEOUT_MS        =  5000;    // broader scan when the lookup misses
inline constexpr uint32_t       RECONNECT_TIMEOUT_MS            =  5000;    // single reconnect from the serializer

// ===== Exchanges =====
inline constexpr uint32_t       COMMAND_TIMEOUT_MS              =  5000;    // overall per command
inline constexpr uint32_t       DIRECT_READ_TIMEOUT_MS          =  2000;    // fallback read when nothing was notified
inline constexpr uint32_t       INTER_COMMAND_DELAY_MS          =   250;    // pacing inside a status refresh
inline constexpr uint32_t       STATUS_SILENCE_WINDOW_MS        =  3000;    // status replies arrive in several notifications
inline constexpr uint32_t       STATUS_MINIMUM_WAIT_MS          =  1500;
inline constexpr uint32_t       ACK_SILENCE_WINDOW_MS           =  1000;
inline constexpr uint32_t       ACK_MINIMUM_WAIT_MS             =   500;

// ===== Discovery =====
inline constexpr uint32_t       DISCOVERY_TIMEOUT_MS            = 15000;

// ===== Input limits =====
inline constexpr float          TARGET_TEMP_MIN_C               =   0.0f;
inline constexpr float          TARGET_TEMP_MAX_C               = 100.0f;
inline constexpr int            TIMER_MIN_MINUTES               =     0;
inline constexpr int            TIMER_MAX_MINUTES               =   999;

/******************************************************************************************************/
/* Structures */
/******************************************************************************************************/

// Completion heuristic for one command class.
// A reply is complete once no fragment arrived for silenceWindowMs and the
// exchange is at least minimumWaitMs old.
struct ResponsePolicy {
  uint32_t silenceWindowMs;
  uint32_t minimumWaitMs;
};

enum class CommandClass {
  Status,       // read queries, replies are known to be split
  Acknowledge   // write commands, replies are short echoes
};

struct AnovaConfig {
  uint8_t        connectAttempts       = CONNECT_ATTEMPTS;
  uint32_t       connectTimeoutMs      = CONNECT_TIMEOUT_MS;
  uint32_t       connectTimeoutFloorMs = CONNECT_TIMEOUT_FLOOR_MS;
  uint32_t       connectBackoffMs      = CONNECT_BACKOFF_MS;
  uint32_t       lookupTimeoutMs       = LOOKUP_TIMEOUT_MS;
  uint32_t       fallbackScanTimeoutMs = FALLBACK_SCAN_TIMEOUT_MS;
  uint32_t       reconnectTimeoutMs    = RECONNECT_TIMEOUT_MS;
  uint32_t       commandTimeoutMs      = COMMAND_TIMEOUT_MS;
  uint32_t       directReadTimeoutMs   = DIRECT_READ_TIMEOUT_MS;
  uint32_t       interCommandDelayMs   = INTER_COMMAND_DELAY_MS;
  uint32_t       discoveryTimeoutMs    = DISCOVERY_TIMEOUT_MS;
  ResponsePolicy statusPolicy          = { STATUS_SILENCE_WINDOW_MS, STATUS_MINIMUM_WAIT_MS };
  ResponsePolicy ackPolicy             = { ACK_SILENCE_WINDOW_MS,    ACK_MINIMUM_WAIT_MS };

  const ResponsePolicy& policyFor(CommandClass cls) const {
    return (cls == CommandClass::Status) ? statusPolicy : ackPolicy;
  }
};

#endif // ANOVA_CONFIG_H
