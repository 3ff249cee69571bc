/* @file ConfigLoader.cpp
 * @brief JSON → PortConfig mapping.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// atlink headers
#include "core/ConfigLoader.hpp"
#include "core/LineReader.hpp"

using namespace atlink::core;
using nlohmann::json;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

PortConfig ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
  return fromJson(doc);
}

PortConfig ConfigLoader::fromJson(const json& doc) {
  PortConfig cfg;
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] top-level value must be an object");

  try {
    if (auto port = doc.find("port"); port != doc.end()) {
      cfg.device = port->value("device", cfg.device);

      auto baud = port->value("baud", 115200UL);
      cfg.options.baud = io::toSpeed(baud);
      if (cfg.options.baud == 0)
        throw std::runtime_error("[ConfigLoader] unsupported baud rate: " + std::to_string(baud));

      cfg.options.dataBits = port->value("dataBits", cfg.options.dataBits);
      if (cfg.options.dataBits < 5 || cfg.options.dataBits > 8)
        throw std::runtime_error("[ConfigLoader] dataBits must be 5..8");

      cfg.options.stopBits = port->value("stopBits", cfg.options.stopBits);
      if (cfg.options.stopBits != 1 && cfg.options.stopBits != 2)
        throw std::runtime_error("[ConfigLoader] stopBits must be 1 or 2");

      cfg.options.interCharTimeout = std::chrono::milliseconds(
          port->value("interCharTimeoutMs", cfg.options.interCharTimeout.count()));
      if (cfg.options.interCharTimeout < std::chrono::milliseconds::zero() ||
          cfg.options.interCharTimeout > io::kMaxInterCharTimeout)
        throw std::runtime_error("[ConfigLoader] interCharTimeoutMs must be 0..25500");
    }

    cfg.commandTimeout =
        std::chrono::milliseconds(doc.value("commandTimeoutMs", cfg.commandTimeout.count()));
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("[ConfigLoader] wrong value type: ") + e.what());
  }

  if (cfg.commandTimeout.count() <= 0)
    throw std::runtime_error("[ConfigLoader] commandTimeoutMs must be positive");
  if (cfg.commandTimeout > kMaxResponseTimeout)
    throw std::runtime_error("[ConfigLoader] commandTimeoutMs exceeds " +
                             std::to_string(kMaxResponseTimeout.count()));
  return cfg;
}
