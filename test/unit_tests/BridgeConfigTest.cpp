#include "BridgeConfig.hpp"
#include "TestHeaders.hpp"

using namespace tb;

namespace {
class TempConfigFile {
 public:
  explicit TempConfigFile(const string& contents) {
    string tmpPath = GetTempDirectory() + string("tb_config_XXXXXXXX");
    directory = string(mkdtemp(&tmpPath[0]));
    path = directory + "/tabbridge.ini";
    std::ofstream out(path);
    out << contents;
  }

  ~TempConfigFile() {
    std::error_code ec;
    fs::remove_all(directory, ec);
  }

  string directory;
  string path;
};
}  // namespace

TEST_CASE("BridgeConfig defaults match the extension endpoint",
          "[BridgeConfig]") {
  BridgeConfig config;
  REQUIRE(config.host == "localhost");
  REQUIRE(config.port == 8000);
  REQUIRE(config.verbose == 0);
  REQUIRE_FALSE(config.silent);
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("BridgeConfigLoader reads networking and debug settings",
          "[BridgeConfig]") {
  TempConfigFile file(
      "[Networking]\n"
      "host = 127.0.0.1\n"
      "port = 9123\n"
      "\n"
      "[Debug]\n"
      "verbose = 2\n"
      "silent = 1\n"
      "logdir = /var/tmp/tb-logs\n"
      "logsize = 1048576\n");
  BridgeConfig config;
  REQUIRE(BridgeConfigLoader::loadFile(file.path, &config));
  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.port == 9123);
  REQUIRE(config.verbose == 2);
  REQUIRE(config.silent);
  REQUIRE(config.logDirectory == "/var/tmp/tb-logs");
  REQUIRE(config.maxLogSize == "1048576");
}

TEST_CASE("BridgeConfigLoader keeps values the file omits",
          "[BridgeConfig]") {
  TempConfigFile file("[Networking]\nport = 8100\n");
  BridgeConfig config;
  config.host = "0.0.0.0";
  REQUIRE(BridgeConfigLoader::loadFile(file.path, &config));
  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.port == 8100);
  REQUIRE(config.verbose == 0);
}

TEST_CASE("BridgeConfigLoader rejects bad values", "[BridgeConfig]") {
  BridgeConfig config;
  SECTION("Port out of range") {
    TempConfigFile file("[Networking]\nport = 70000\n");
    REQUIRE_THROWS_AS(BridgeConfigLoader::loadFile(file.path, &config),
                      InvalidParameter);
  }
  SECTION("Port is not a number") {
    TempConfigFile file("[Networking]\nport = eighty\n");
    REQUIRE_THROWS_AS(BridgeConfigLoader::loadFile(file.path, &config),
                      InvalidParameter);
  }
  SECTION("Trailing garbage") {
    TempConfigFile file("[Debug]\nverbose = 3x\n");
    REQUIRE_THROWS_AS(BridgeConfigLoader::loadFile(file.path, &config),
                      InvalidParameter);
  }
}

TEST_CASE("BridgeConfigLoader reports unreadable files", "[BridgeConfig]") {
  BridgeConfig config;
  REQUIRE_FALSE(BridgeConfigLoader::loadFile(
      GetTempDirectory() + "tb-no-such-dir/tabbridge.ini", &config));
  REQUIRE(config.port == DEFAULT_BRIDGE_PORT);
}

TEST_CASE("BridgeConfigLoader validates ports", "[BridgeConfig]") {
  REQUIRE(BridgeConfigLoader::validatePort(1) == 1);
  REQUIRE(BridgeConfigLoader::validatePort(65535) == 65535);
  REQUIRE_THROWS_AS(BridgeConfigLoader::validatePort(0), InvalidParameter);
  REQUIRE(BridgeConfigLoader::defaultConfigPath().find(
              "tabbridge/tabbridge.ini") != string::npos);
}
