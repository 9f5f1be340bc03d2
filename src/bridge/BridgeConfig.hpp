#ifndef __TB_BRIDGE_CONFIG__
#define __TB_BRIDGE_CONFIG__

#include "BridgeErrors.hpp"
#include "Headers.hpp"

namespace tb {
/** @brief Settings for the tabbridge process. */
struct BridgeConfig {
  string host = DEFAULT_BRIDGE_HOST;
  int port = DEFAULT_BRIDGE_PORT;
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  string logDirectory = GetTempDirectory() + "tabbridge";
  // default max log file size is 20MB
  string maxLogSize = "20971520";
};

/**
 * @brief Reads BridgeConfig values from an INI file.
 *
 * Recognized keys:
 *
 *     [Networking]
 *     host = localhost
 *     port = 8000
 *
 *     [Debug]
 *     verbose = 0
 *     silent = 0
 *     logdir = /tmp/tabbridge
 *     logsize = 20971520
 *
 * Keys that are absent keep the value already in the config.
 */
class BridgeConfigLoader {
 public:
  /** @brief `<config home>/tabbridge/tabbridge.ini`. */
  static string defaultConfigPath();

  /**
   * @brief Applies the values found in `path` to `config`.
   * @return false if the file cannot be read or parsed.
   * @throws InvalidParameter if a value is out of range or not a number.
   */
  static bool loadFile(const string& path, BridgeConfig* config);

  /** @throws InvalidParameter unless 1 <= port <= 65535. */
  static int validatePort(int port);
};
}  // namespace tb

#endif  // __TB_BRIDGE_CONFIG__
