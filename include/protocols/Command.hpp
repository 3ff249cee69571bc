#pragma once
/** @file  Command.hpp
 *  @brief AT command bodies, forms and wire framing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <string_view>

namespace atlink {
  namespace protocols {

    inline constexpr std::string_view kPrefix = "AT";
    inline constexpr std::string_view kTerminator = "\r\n";

    /**
 * @enum CommandBody
 * @brief Well-known command bodies; each value carries its literal body string.
 */
    enum class CommandBody : std::uint8_t { Probe, EchoOff, EchoOn, NetworkOperator, Count };
    static_assert(static_cast<std::uint8_t>(CommandBody::Count) == 4,
                  "CommandBody count changed please update toBody()");

    inline constexpr std::string_view toBody(CommandBody b) {
      switch (b) {
      case CommandBody::Probe:
        return "";
      case CommandBody::EchoOff:
        return "E0";
      case CommandBody::EchoOn:
        return "E1";
      case CommandBody::NetworkOperator:
        return "COPS";
      default:
        return "";
      }
    }

    /// Basic sends the body as-is, Read queries a setting, Execute runs an action.
    enum class CommandForm : std::uint8_t { Basic, Read, Execute };

    /// "AT" + body + "\r\n"; any bytes pass through unvalidated.
    inline std::string frame(std::string_view body) {
      std::string out;
      out.reserve(kPrefix.size() + body.size() + kTerminator.size());
      out.append(kPrefix).append(body).append(kTerminator);
      return out;
    }

    /// "+" + body + "?"
    inline std::string readForm(std::string_view body) {
      std::string out = "+";
      out.append(body).push_back('?');
      return out;
    }

    /// "+" + body
    inline std::string executeForm(std::string_view body) { return std::string("+").append(body); }

    struct Command {
      std::string body;
      CommandForm form{ CommandForm::Basic };

      /// Body after the form has been applied, without prefix or terminator.
      std::string shapedBody() const {
        switch (form) {
        case CommandForm::Read:
          return readForm(body);
        case CommandForm::Execute:
          return executeForm(body);
        default:
          return body;
        }
      }

      std::string toWire() const { return frame(shapedBody()); }
    };

  } // namespace protocols
} // namespace atlink
