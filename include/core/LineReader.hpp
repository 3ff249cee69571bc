#pragma once
/** @file  LineReader.hpp
 *  @brief Deadline- and stop-token-aware line reader over a Transport.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace atlink::io {
  class Transport;
} // namespace atlink::io

namespace atlink::core {

  using Clock = std::chrono::steady_clock;

  /// Upper bound on one blocking transport read; bounds how late a cancelled read notices.
  inline constexpr std::chrono::milliseconds kPollSlice{ 10 };

  /// Longest response window accepted; keeps `Clock::now() + timeout` inside the clock's range.
  inline constexpr std::chrono::milliseconds kMaxResponseTimeout = std::chrono::hours{ 24 };

  /**
 * @class LineReader
 * @brief Buffers transport bytes and hands them out one line at a time.
 *
 *  * Lines end at '\n'; the '\n' and one preceding '\r' are stripped.
 *  * "No data yet" from the transport is retried, never treated as EOF.
 *  * Bytes after a returned line stay buffered for the next call.
 *  * Not thread-safe; one reader per exchange.
 */
  class LineReader {
  public:
    explicit LineReader(io::Transport& transport) : transport_(transport) {}

    /**
     * @brief Read one framed line.
     * @throws AtError{Timeout} when \p deadline passes or \p stop is requested first.
     * @throws AtError{TransportError} when the transport reports a fault.
     */
    std::string readLine(Clock::time_point deadline, std::stop_token stop = {});

    /// Bytes received but not yet returned as a line.
    const std::string& pending() const { return rx_buffer_; }

  private:
    std::optional<std::string> takeBufferedLine();

    io::Transport& transport_;
    std::string rx_buffer_{};
  };

} // namespace atlink::core
