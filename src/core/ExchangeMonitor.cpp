/* @file ExchangeMonitor.cpp
 * @brief stream-backed exchange log.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <iomanip>

// atlink headers
#include "core/ExchangeMonitor.hpp"
#include "protocols/Response.hpp"

namespace atlink {
  namespace core {

    std::string escapeControl(std::string_view text) {
      std::string out;
      out.reserve(text.size());
      for (char c : text) {
        if (c == '\r')
          out += "\\r";
        else if (c == '\n')
          out += "\\n";
        else
          out += c;
      }
      return out;
    }

    void LogMonitor::notifyCommandSent(std::string_view frame) {
      emit("send", escapeControl(frame));
    }

    void LogMonitor::notifyOutcome(const protocols::ExecutionOutcome& outcome) {
      emit(outcome.success ? "ok" : "nak", escapeControl(outcome.payload));
    }

    void LogMonitor::notifyFailure(const std::string& message) { emit("fail", message); }

    void LogMonitor::emit(std::string_view tag, std::string_view text) {
      const auto now = std::chrono::system_clock::now();
      const std::time_t secs = std::chrono::system_clock::to_time_t(now);
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;
      std::tm local{};
      localtime_r(&secs, &local);

      std::lock_guard<std::mutex> lock(mtx_);
      out_ << std::put_time(&local, "%Y/%m/%d %H:%M:%S") << '.' << std::setfill('0')
           << std::setw(3) << ms.count() << " [" << tag << "] " << text << '\n';
    }

  } // namespace core
} // namespace atlink
