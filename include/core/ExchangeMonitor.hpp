#pragma once
/** @file  ExchangeMonitor.hpp
 *  @brief Observer hooks for command exchanges, plus a stream-logging implementation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace atlink::protocols {
  struct ExecutionOutcome;
} // namespace atlink::protocols

namespace atlink::core {

  /**
 * @class ExchangeMonitor
 * @brief Injected into CommandExecutor in place of process-wide logging.
 *
 * * Every hook defaults to a no-op so tests can run without one.
 * * Hooks are called on the executor's (caller's) thread.
 */
  class ExchangeMonitor {
  public:
    ExchangeMonitor() = default;
    virtual ~ExchangeMonitor() = default;

    /// Called with the exact wire frame just before it is written.
    virtual void notifyCommandSent(std::string_view /*frame*/) {}

    /// Called once per exchange that completed the protocol (OK or not).
    virtual void notifyOutcome(const protocols::ExecutionOutcome& /*outcome*/) {}

    /// Called with a phase-tagged message when an exchange fails.
    virtual void notifyFailure(const std::string& /*message*/) {}
  };

  /**
 * @class LogMonitor
 * @brief Writes one timestamped line per event to an ostream (std::cerr in the CLI).
 *
 * * CR / LF are escaped so frames stay on one line.
 * * Thread-safe (mutex-protected stream).
 */
  class LogMonitor : public ExchangeMonitor {
  public:
    explicit LogMonitor(std::ostream& out) : out_(out) {}

    void notifyCommandSent(std::string_view frame) override;
    void notifyOutcome(const protocols::ExecutionOutcome& outcome) override;
    void notifyFailure(const std::string& message) override;

  private:
    void emit(std::string_view tag, std::string_view text);

    std::ostream& out_;
    std::mutex mtx_;
  };

  /// Render \r and \n as visible escapes.
  std::string escapeControl(std::string_view text);

} // namespace atlink::core
