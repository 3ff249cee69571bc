/* @file CommandExecutor.cpp
 * @brief one blocking AT exchange: frame + write, two-phase response wait, OK/ERROR classification
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

// atlink headers
#include "core/AtError.hpp"
#include "core/CommandExecutor.hpp"
#include "core/LineReader.hpp"
#include "core/ResponseWaiter.hpp"
#include "io/Transport.hpp"

using namespace atlink::core;
using atlink::protocols::Command;
using atlink::protocols::CommandBody;
using atlink::protocols::CommandForm;
using atlink::protocols::ExecutionOutcome;

CommandExecutor::CommandExecutor(io::Transport& transport, std::shared_ptr<ExchangeMonitor> monitor)
    : transport_(transport), monitor_(std::move(monitor)) {
  if (!monitor_)
    monitor_ = std::make_shared<ExchangeMonitor>(); // silent default
}

ExecutionOutcome CommandExecutor::execute(const Command& cmd, std::chrono::milliseconds timeout) {
  ExecutionOutcome outcome;

  // Idle → Sent
  const auto wire = cmd.toWire();
  monitor_->notifyCommandSent(wire);
  if (!transport_.write(wire))
    return fail(std::move(outcome), ErrorCode::WriteError, "write",
                "transport rejected the command frame");

  // Construct a reader for all read operations of this exchange
  LineReader reader(transport_);

  // Sent → AwaitingPayload
  try {
    outcome.payload = ResponseWaiter::waitForResponse(reader, timeout);
  } catch (const AtError& e) {
    return fail(std::move(outcome), e.code(), "response", e.what());
  }

  // A "+KEY: value" payload is followed by its own OK/ERROR line, fetched with a fresh timeout
  std::string status = outcome.payload;
  if (protocols::isContinuation(outcome.payload)) {
    try {
      status = ResponseWaiter::waitForStatus(reader, timeout);
    } catch (const AtError& e) {
      return fail(std::move(outcome), e.code(), "status", e.what());
    }
  }

  outcome.success = protocols::isOkStatus(status);
  monitor_->notifyOutcome(outcome);
  return outcome;
}

ExecutionOutcome CommandExecutor::execute(std::string_view body, std::chrono::milliseconds timeout) {
  return execute(Command{ std::string(body), CommandForm::Basic }, timeout);
}

ExecutionOutcome CommandExecutor::execute(CommandBody body, std::chrono::milliseconds timeout) {
  return execute(protocols::toBody(body), timeout);
}

ExecutionOutcome CommandExecutor::executeRead(std::string_view body,
                                              std::chrono::milliseconds timeout) {
  return execute(Command{ std::string(body), CommandForm::Read }, timeout);
}

ExecutionOutcome CommandExecutor::executeRead(CommandBody body, std::chrono::milliseconds timeout) {
  return executeRead(protocols::toBody(body), timeout);
}

ExecutionOutcome CommandExecutor::executeExecute(std::string_view body,
                                                 std::chrono::milliseconds timeout) {
  return execute(Command{ std::string(body), CommandForm::Execute }, timeout);
}

ExecutionOutcome CommandExecutor::executeExecute(CommandBody body,
                                                 std::chrono::milliseconds timeout) {
  return executeExecute(protocols::toBody(body), timeout);
}

ExecutionOutcome CommandExecutor::fail(ExecutionOutcome outcome, ErrorCode code,
                                       const std::string& phase, const std::string& detail) {
  std::string errMsg = "[CommandExecutor] " + phase + " phase failed: " + detail;
  monitor_->notifyFailure(errMsg);
  outcome.success = false;
  outcome.error.emplace(code, errMsg);
  return outcome;
}
