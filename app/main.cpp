/* @file main.cpp
 * @brief atlink CLI - opens the modem tty and runs AT exchanges against it
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// atlink headers
#include "core/CommandExecutor.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ExchangeMonitor.hpp"
#include "io/SerialChannel.hpp"

namespace {

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-c config.json] [BODY...]\n"
              << "  With no BODY, probes the modem (AT) and queries the network operator (AT+COPS?).\n"
              << "  Each BODY is sent as AT<BODY>\\r\\n.\n";
  }

  void report(const std::string& label, const atlink::protocols::ExecutionOutcome& out) {
    std::cout << label << ": \"" << atlink::core::escapeControl(out.payload) << "\" "
              << (out.success ? "OK" : "NOT OK");
    if (out.error)
      std::cout << " (" << atlink::core::toString(out.error->code()) << ": " << out.error->what()
                << ")";
    std::cout << '\n';
  }

} // namespace

int main(int argc, char** argv) {
  std::string configPath;
  std::vector<std::string> bodies;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return EXIT_SUCCESS;
    }
    if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        usage(argv[0]);
        return EXIT_FAILURE;
      }
      configPath = argv[i];
      continue;
    }
    bodies.push_back(std::move(arg));
  }

  try {
    atlink::core::PortConfig cfg;
    if (!configPath.empty())
      cfg = atlink::core::ConfigLoader(configPath).load();

    atlink::io::SerialChannel port;
    if (!port.open(cfg.device, cfg.options))
      throw std::runtime_error("[atlink] failed to open port: " + cfg.device);

    atlink::core::CommandExecutor executor(port,
                                           std::make_shared<atlink::core::LogMonitor>(std::cerr));
    bool failed = false;

    if (bodies.empty()) {
      auto probe = executor.execute(atlink::protocols::CommandBody::Probe, cfg.commandTimeout);
      report("AT", probe);
      failed |= probe.error.has_value();

      auto cops =
          executor.executeRead(atlink::protocols::CommandBody::NetworkOperator, cfg.commandTimeout);
      report("AT+COPS?", cops);
      failed |= cops.error.has_value();
    } else {
      for (const auto& body : bodies) {
        auto out = executor.execute(body, cfg.commandTimeout);
        report("AT" + body, out);
        failed |= out.error.has_value();
      }
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
