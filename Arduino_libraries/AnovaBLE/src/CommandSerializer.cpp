#include "CommandSerializer.h"
#include "logger.h"

// ===== Turn: holds the gate for one caller ==============================================
class CommandSerializer::Turn {
public:
  explicit Turn(CommandSerializer& owner) : s(owner) {
    std::unique_lock<std::mutex> lock(s.mtx);
    ticket = s.nextTicket++;
    s.cv.wait(lock, [this] { return s.serving == ticket; });
  }
  ~Turn() {
    {
      std::lock_guard<std::mutex> lock(s.mtx);
      s.serving++;
    }
    s.cv.notify_all();
  }
  Turn(const Turn&) = delete;
  Turn& operator=(const Turn&) = delete;

private:
  CommandSerializer& s;
  uint32_t           ticket = 0;
};

// ===== Exchange scope: the accumulator slot is always closed again =======================
namespace {
class ExchangeScope {
public:
  ExchangeScope(ResponseAccumulator& a, const std::string& command) : acc(a) { acc.begin(command); }
  ~ExchangeScope() { acc.end(); }
  ExchangeScope(const ExchangeScope&) = delete;
  ExchangeScope& operator=(const ExchangeScope&) = delete;
private:
  ResponseAccumulator& acc;
};
} // namespace

CommandSerializer::CommandSerializer(ConnectionManager& conn, ResponseAccumulator& acc, const AnovaConfig& cfg)
  : connection(conn), accumulator(acc), config(cfg) {}

uint32_t CommandSerializer::queued() const {
  std::lock_guard<std::mutex> lock(mtx);
  const uint32_t inLine = nextTicket - serving;
  return inLine > 0 ? inLine - 1 : 0;
}

std::optional<std::string> CommandSerializer::execute(const std::string& command, CommandClass cls, uint32_t timeoutMs) {
  Turn turn(*this);

  char esc[64];
  logEscape(esc, sizeof(esc), command.data(), command.size());

  if (!connection.isConnected()) {
    LOGI("Not connected, reconnecting before \"%s\"", esc);
    if (!connection.reconnect(config.reconnectTimeoutMs)) {
      LOGW("Device unreachable, \"%s\" not sent", esc);
      return std::nullopt;
    }
  }

  std::optional<std::string> reply = exchange(command, cls, timeoutMs);
  #ifdef DEBUG
    if (reply) {
      char escReply[64];
      LOGD("\"%s\" -> \"%s\"", esc, logEscape(escReply, sizeof(escReply), reply->data(), reply->size()));
    }
  #endif
  return reply;
}

std::optional<std::string> CommandSerializer::exchange(const std::string& command, CommandClass cls, uint32_t timeoutMs) {
  const uint32_t        epoch  = connection.epoch();
  const ResponsePolicy& policy = config.policyFor(cls);
  std::string           reply;
  ExchangeResult        result = ExchangeResult::Aborted;

  {
    ExchangeScope scope(accumulator, command);

    if (!connection.write(command)) return std::nullopt;

    // Without notifications only give the device time to answer, then read
    const uint32_t waitMs = connection.notificationsEnabled() ? timeoutMs : policy.minimumWaitMs;
    result = accumulator.wait(policy, waitMs, reply);

    if (result == ExchangeResult::NoFragments) {
      if (connection.notificationsEnabled()) {
        LOGW("Timeout waiting for response, reading characteristic directly");
      }
      std::string raw;
      if (connection.read(raw, config.directReadTimeoutMs)) reply = trimReply(raw);
    } else if (result == ExchangeResult::PartialTimeout) {
      LOGD("Response incomplete after %u ms, using %u bytes", (unsigned)timeoutMs, (unsigned)reply.size());
    }
  }
  LOGD("Exchange ended: %s", exchangeResultName(result));

  // A reply that straddles a disconnect belongs to a link that no longer exists
  if (result == ExchangeResult::Aborted || connection.epoch() != epoch || !connection.isConnected()) {
    LOGW("Link lost during exchange, reply discarded");
    return std::nullopt;
  }
  if (reply.empty()) return std::nullopt;
  return reply;
}
