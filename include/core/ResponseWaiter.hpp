#pragma once
/** @file  ResponseWaiter.hpp
 *  @brief Races the framed AT response reads against a deadline.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

// atlink headers
#include "core/LineReader.hpp"

namespace atlink::core {

  /**
 * @class ResponseWaiter
 * @brief Runs the line reads of one response on a per-call worker thread.
 *
 *  * One deadline covers every read of the call.
 *  * The worker hands its line (or its error) back through a single-slot future.
 *  * On timeout the worker is stopped and joined before returning, so no
 *    stray read is left to consume the next command's bytes.
 *
 *  Both calls throw AtError: Timeout (no line within \p timeout), TransportError
 *  (the worker's read failed) or ChannelClosedUnexpectedly (the worker exited
 *  without a result).
 */
  class ResponseWaiter {
  public:
    /// `\r\n<payload>\r\n`: drops the framing (or echo) line, returns the payload line.
    static std::string waitForResponse(LineReader& reader, std::chrono::milliseconds timeout);

    /// Status line after a `+` payload: skips blank framing lines, returns the first non-blank one.
    static std::string waitForStatus(LineReader& reader, std::chrono::milliseconds timeout);

    /// Reads run by the worker; std::nullopt means it ended without a line.
    using ReadFn =
        std::function<std::optional<std::string>(LineReader&, Clock::time_point, std::stop_token)>;

    /**
     * @brief Run \p fn on a fresh worker and wait at most \p timeout for its line.
     *
     * \p timeout is clamped to [0, kMaxResponseTimeout].
     */
    static std::string race(LineReader& reader, std::chrono::milliseconds timeout, ReadFn fn);
  };

} // namespace atlink::core
