/* @file ResponseWaiter.cpp
 * @brief worker + single-slot hand-off raced against the response deadline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <utility>

// atlink headers
#include "core/AtError.hpp"
#include "core/ResponseWaiter.hpp"
#include "protocols/Response.hpp"

using namespace atlink::core;

std::string ResponseWaiter::waitForResponse(LineReader& reader, std::chrono::milliseconds timeout) {
  // Format of responses is <CR><LF> RESPONSE <CR><LF>: drop the first line, keep the second.
  return race(reader, timeout,
              [](LineReader& r, Clock::time_point deadline,
                 std::stop_token stop) -> std::optional<std::string> {
                r.readLine(deadline, stop);
                return r.readLine(deadline, stop);
              });
}

std::string ResponseWaiter::waitForStatus(LineReader& reader, std::chrono::milliseconds timeout) {
  return race(reader, timeout,
              [](LineReader& r, Clock::time_point deadline,
                 std::stop_token stop) -> std::optional<std::string> {
                for (;;) {
                  auto line = r.readLine(deadline, stop);
                  if (!protocols::trim(line).empty())
                    return line;
                }
              });
}

std::string ResponseWaiter::race(LineReader& reader, std::chrono::milliseconds timeout, ReadFn fn) {
  const auto deadline =
      Clock::now() + std::clamp(timeout, std::chrono::milliseconds::zero(), kMaxResponseTimeout);

  std::promise<std::string> slot;
  std::future<std::string> result = slot.get_future();

  std::jthread worker([&reader, deadline, fn = std::move(fn),
                       slot = std::move(slot)](std::stop_token stop) mutable {
    auto out = std::move(slot); // released when the worker returns, delivered or not
    try {
      if (auto line = fn(reader, deadline, stop))
        out.set_value(std::move(*line));
    } catch (...) {
      out.set_exception(std::current_exception()); // rethrown by result.get() below
    }
  });

  if (result.wait_until(deadline) != std::future_status::ready) {
    worker.request_stop();
    worker.join();
    throw AtError(ErrorCode::Timeout, "[ResponseWaiter] operation timed out");
  }

  try {
    return result.get();
  } catch (const std::future_error&) {
    throw AtError(ErrorCode::ChannelClosedUnexpectedly,
                  "[ResponseWaiter] channel closed unexpectedly");
  }
}
