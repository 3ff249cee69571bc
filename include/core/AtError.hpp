#pragma once
/** @file  AtError.hpp
 *  @brief Failure taxonomy for one AT command exchange.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

namespace atlink::core {

  enum class ErrorCode : std::uint8_t {
    WriteError,               ///< transport rejected the outgoing frame
    Timeout,                  ///< no complete response before the deadline
    TransportError,           ///< stream fault other than "no data yet"
    ChannelClosedUnexpectedly ///< worker ended without a result (programming defect)
  };

  inline const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::WriteError:
      return "WriteError";
    case ErrorCode::Timeout:
      return "Timeout";
    case ErrorCode::TransportError:
      return "TransportError";
    case ErrorCode::ChannelClosedUnexpectedly:
      return "ChannelClosedUnexpectedly";
    default:
      return "Unknown";
    }
  }

  /**
   * @class AtError
   * @brief runtime_error tagged with an ErrorCode so callers can branch on the
   *        failure kind without parsing the message.
   */
  class AtError : public std::runtime_error {
  public:
    AtError(ErrorCode code, const std::string& what) : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
  };

} // namespace atlink::core
