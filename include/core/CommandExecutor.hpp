#pragma once
/** @file  CommandExecutor.hpp
 *  @brief Synchronous AT request/response engine over a borrowed Transport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

// atlink headers
#include "core/ExchangeMonitor.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace atlink::io {
  class Transport;
} // namespace atlink::io

namespace atlink {
  namespace core {

    /**
 * @class CommandExecutor
 * @brief Write → framing line → payload line → (status line) → classify.
 *
 *  * One exchange at a time per Transport; no internal locking, callers sharing
 *    a transport serialize externally.
 *  * Never retries. Failures come back in `ExecutionOutcome::error` tagged with
 *    the phase (write / response / status); a non-OK status is only `success=false`.
 *  * Borrows the transport; its lifetime is the caller's business.
 */
    class CommandExecutor {
    public:
      explicit CommandExecutor(io::Transport& transport,
                               std::shared_ptr<ExchangeMonitor> monitor = nullptr);
      ~CommandExecutor() = default;

      //---public APIs------------------------------------------------------
      protocols::ExecutionOutcome execute(const protocols::Command& cmd,
                                          std::chrono::milliseconds timeout);

      /// Sends `AT<body>\r\n`.
      protocols::ExecutionOutcome execute(std::string_view body, std::chrono::milliseconds timeout);
      protocols::ExecutionOutcome execute(protocols::CommandBody body,
                                          std::chrono::milliseconds timeout);

      /// Sends `AT+<body>?\r\n`.
      protocols::ExecutionOutcome executeRead(std::string_view body,
                                              std::chrono::milliseconds timeout);
      protocols::ExecutionOutcome executeRead(protocols::CommandBody body,
                                              std::chrono::milliseconds timeout);

      /// Sends `AT+<body>\r\n`.
      protocols::ExecutionOutcome executeExecute(std::string_view body,
                                                 std::chrono::milliseconds timeout);
      protocols::ExecutionOutcome executeExecute(protocols::CommandBody body,
                                                 std::chrono::milliseconds timeout);

    private:
      protocols::ExecutionOutcome fail(protocols::ExecutionOutcome outcome, ErrorCode code,
                                       const std::string& phase, const std::string& detail);

      io::Transport& transport_;
      std::shared_ptr<ExchangeMonitor> monitor_;
    };

  } // namespace core
} // namespace atlink
