#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) for the modem port and command timing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

// atlink headers
#include "io/SerialChannel.hpp"

// third-party headers
#include <nlohmann/json_fwd.hpp>

namespace atlink::core {

  /// Everything needed to open the modem tty and time its exchanges.
  struct PortConfig {
    std::string device{ "/dev/ttyUSB2" };
    io::PortOptions options{};
    std::chrono::milliseconds commandTimeout{ 1000 };
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto PortConfig.
 *
 *  * No caching: every call to `load()` re-reads the file (cheap, tiny file).
 *  * Missing keys keep their PortConfig defaults; bad values throw.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a PortConfig or throw `std::runtime_error`.
    PortConfig load() const;

    /// Map an already-parsed document; throws `std::runtime_error` on invalid values.
    static PortConfig fromJson(const nlohmann::json& doc);

  private:
    std::string path_;
  };

} // namespace atlink::core
