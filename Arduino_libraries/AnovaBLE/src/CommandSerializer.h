/******************************************************************************************************/
// CommandSerializer
//
// Gate in front of the single shared characteristic. Exactly one exchange (write + collect reply)
// runs at a time, callers are served in arrival order. The gate is released only after the
// exchange has been cleaned up, so a late fragment can not be attributed to the next command.
/******************************************************************************************************/

#ifndef COMMAND_SERIALIZER_H
#define COMMAND_SERIALIZER_H

#include <stdint.h>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

#include "AnovaConfig.h"
#include "ConnectionManager.h"
#include "ResponseAccumulator.h"

class CommandSerializer {
public:
  CommandSerializer(ConnectionManager& connection, ResponseAccumulator& accumulator, const AnovaConfig& config);
  CommandSerializer(const CommandSerializer&) = delete;
  CommandSerializer& operator=(const CommandSerializer&) = delete;

  // Send command and collect its reply. Returns std::nullopt when the device is unreachable,
  // nothing came back, or the link was lost while waiting.
  std::optional<std::string> execute(const std::string& command, CommandClass cls, uint32_t timeoutMs);
  std::optional<std::string> execute(const std::string& command, CommandClass cls) {
    return execute(command, cls, config.commandTimeoutMs);
  }

  // Callers queued behind the running exchange
  uint32_t queued() const;

private:
  class Turn;
  friend class Turn;

  std::optional<std::string> exchange(const std::string& command, CommandClass cls, uint32_t timeoutMs);

  ConnectionManager&      connection;
  ResponseAccumulator&    accumulator;
  AnovaConfig             config;

  // ticket lock, FIFO
  mutable std::mutex      mtx;
  std::condition_variable cv;
  uint32_t                nextTicket = 0;
  uint32_t                serving    = 0;
};

#endif // COMMAND_SERIALIZER_H
