#pragma once
/** @file  Response.hpp
 *  @brief Response line classification and the per-exchange outcome.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <string_view>

// atlink headers
#include "core/AtError.hpp"

namespace atlink {
  namespace protocols {

    inline constexpr std::string_view kOkStatus = "OK";
    inline constexpr char kContinuationMarker = '+';

    /// Strips ASCII whitespace (space, \t, \r, \n, \v, \f) from both ends.
    inline std::string_view trim(std::string_view s) {
      constexpr std::string_view ws = " \t\r\n\v\f";
      auto first = s.find_first_not_of(ws);
      if (first == std::string_view::npos)
        return {};
      auto last = s.find_last_not_of(ws);
      return s.substr(first, last - first + 1);
    }

    /// True iff the trimmed line is exactly "OK".
    inline bool isOkStatus(std::string_view line) { return trim(line) == kOkStatus; }

    /// `+KEY: value` lines are followed by a separate status line.
    inline bool isContinuation(std::string_view line) {
      return !line.empty() && line.front() == kContinuationMarker;
    }

    /**
 * @struct ExecutionOutcome
 * @brief Result of exactly one command exchange.
 *
 *  * `success == false` with no `error` is a negative device acknowledgement.
 *  * `error` set means the exchange itself broke (see core::ErrorCode).
 */
    struct ExecutionOutcome {
      std::string payload;
      bool success{ false };
      std::optional<core::AtError> error;

      bool ok() const { return success && !error; }
    };

  } // namespace protocols
} // namespace atlink
