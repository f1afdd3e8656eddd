/******************************************************************************************************/
// StatusProtocol
//
// Text commands understood by the cooker and the decoding of its replies.
//
// There is no single query that reliably returns every field, a refresh is four round trips:
//
//   read unit\r      -> "c" / "f"
//   status\r         -> "running" / "stopped"  (may carry "timer <min>")
//   read set temp\r  -> "55.5"
//   read temp\r      -> "54.9"
//
// Temperatures arrive in the unit the device is set to and are cached in Celsius.
/******************************************************************************************************/

#ifndef STATUS_PROTOCOL_H
#define STATUS_PROTOCOL_H

#include <optional>
#include <string>

enum class TemperatureUnit : char {
  Celsius    = 'C',
  Fahrenheit = 'F'
};

// Last known state of the cooker. Every field stays empty until a refresh delivered it.
struct DeviceStatus {
  std::optional<float>           currentTemperature;   // Celsius
  std::optional<float>           targetTemperature;    // Celsius
  std::optional<int>             timerMinutes;
  std::optional<bool>            running;
  std::optional<TemperatureUnit> unit;                 // display unit of the device

  bool operator==(const DeviceStatus& o) const {
    return currentTemperature == o.currentTemperature && targetTemperature == o.targetTemperature &&
           timerMinutes == o.timerMinutes && running == o.running && unit == o.unit;
  }
  bool operator!=(const DeviceStatus& o) const { return !(*this == o); }
};

enum class CommandOutcome {
  Acknowledged,   // reply received and understood
  NoReply,        // nothing came back
  Malformed       // a reply came back but carries nothing usable
};

enum class StatusQuery {
  Unit,
  RunState,
  TargetTemperature,
  CurrentTemperature
};

namespace StatusProtocol
{
  // Order of a full refresh; the unit comes first so the temperatures can be converted
  inline constexpr StatusQuery REFRESH_SEQUENCE[] = {
    StatusQuery::Unit,
    StatusQuery::RunState,
    StatusQuery::TargetTemperature,
    StatusQuery::CurrentTemperature,
  };

  const char* queryCommand(StatusQuery q);
  const char* queryName(StatusQuery q);
  const char* outcomeName(CommandOutcome o);

  // ======================= ENCODE =======================
  // celsius is converted when the device displays Fahrenheit: 60.0 -> "set temp 140.0\r"
  std::string encodeSetTemperature(float celsius, std::optional<TemperatureUnit> deviceUnit);
  std::string encodeSetTimer(int minutes);
  std::string encodeSetUnit(TemperatureUnit unit);

  // ======================= DECODE =======================
  std::optional<bool>  decodeRunState(const std::string& reply);
  TemperatureUnit      decodeUnit(const std::string& reply);
  // Keeps digits, '.', '-' only; converted to Celsius when knownUnit is Fahrenheit
  std::optional<float> decodeTemperature(const std::string& reply, std::optional<TemperatureUnit> knownUnit);
  // "timer 15", "Timer: 15"
  std::optional<int>   decodeTimer(const std::string& reply);

  // Apply the reply to query q onto status. Only fields the reply actually carries are written.
  CommandOutcome       apply(StatusQuery q, const std::string& reply, DeviceStatus& status);

  // Any reply with a printable character acknowledges a write command
  CommandOutcome       classifyAcknowledgement(const std::optional<std::string>& reply);

  // ======================= UNITS =======================
  inline float toCelsius(float f)    { return (f - 32.0f) * 5.0f / 9.0f; }
  inline float toFahrenheit(float c) { return c * 9.0f / 5.0f + 32.0f; }

} // namespace StatusProtocol

#endif // STATUS_PROTOCOL_H
