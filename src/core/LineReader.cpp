/* @file LineReader.cpp
 * @brief cancellable line reads - retries on "no data yet", fails on deadline, stop or stream fault
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstring> // for strerror

// atlink headers
#include "core/AtError.hpp"
#include "core/LineReader.hpp"
#include "io/Transport.hpp"

using namespace atlink::core;

std::string LineReader::readLine(Clock::time_point deadline, std::stop_token stop) {
  char temp[256];

  for (;;) {
    const auto now = Clock::now();
    if (stop.stop_requested() || now >= deadline)
      throw AtError(ErrorCode::Timeout, "[LineReader] operation timed out");

    if (auto line = takeBufferedLine())
      return *line;

    auto slice = std::min(kPollSlice,
                          std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    auto res = transport_.read(temp, sizeof(temp), slice);
    switch (res.status) {
    case io::ReadStatus::Data:
      rx_buffer_.append(temp, res.count);
      break;
    case io::ReadStatus::WouldBlock:
      break; // nothing yet → retry
    case io::ReadStatus::Error:
    default:
      throw AtError(ErrorCode::TransportError,
                    std::string("[LineReader] transport read failed: ") + strerror(res.err));
    }
  }
}

std::optional<std::string> LineReader::takeBufferedLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  auto len = pos;
  if (len > 0 && rx_buffer_[len - 1] == '\r')
    --len;
  std::string line = rx_buffer_.substr(0, len);
  rx_buffer_.erase(0, pos + 1); // remove line + LF
  return line;
}
