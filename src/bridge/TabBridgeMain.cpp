#include <cxxopts.hpp>

#include "BridgeConfig.hpp"
#include "BridgePlugin.hpp"
#include "ConsoleHost.hpp"
#include "LogHandler.hpp"

using namespace tb;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tb::InterruptSignalHandler);

  cxxopts::Options options(
      "tabbridge", "Bridge between an automation host and a browser extension");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Host name or address to listen on",
         cxxopts::value<string>())                             //
        ("port", "Port to listen on", cxxopts::value<int>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files", cxxopts::value<string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tabbridge version " << TB_VERSION << endl;
      exit(0);
    }

    BridgeConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      if (!BridgeConfigLoader::loadFile(cfgfilename, &config)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    } else if (fs::exists(BridgeConfigLoader::defaultConfigPath())) {
      BridgeConfigLoader::loadFile(BridgeConfigLoader::defaultConfigPath(),
                                   &config);
    }

    // command line options win over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = BridgeConfigLoader::validatePort(result["port"].as<int>());
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    config.logToStdout = result.count("logtostdout") > 0;

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, config.logDirectory, "tabbridge", config.logToStdout,
        !config.logToStdout, true, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tabbridge-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    LOG(INFO) << "tabbridge " << TB_VERSION << " logging to " << logFile;

    ConsoleHost host("GoogleChrome");
    BridgePlugin plugin(&host, &host);
    const PluginInfo &info = BridgePlugin::getInfo();
    LOG(INFO) << "Loaded plugin " << info.name << " " << info.version;

    try {
      plugin.start(config.host, config.port);
    } catch (const BindError &be) {
      CLOG(INFO, "stdout") << "Error: " << be.what() << endl;
      el::Helpers::uninstallPreRollOutCallback();
      exit(1);
    }
    CLOG(INFO, "stdout") << "Listening on ws://" << config.host << ":"
                         << config.port << endl;
    string actionNames;
    for (const auto& name : host.getActionNames()) {
      actionNames += (actionNames.empty() ? "" : ", ") + name;
    }
    CLOG(INFO, "stdout") << "Actions: " << actionNames << endl;

    host.run(std::cin);
    plugin.stop();
    LOG(INFO) << "Plugin " << pluginStateToString(plugin.getState());
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const InvalidParameter &ip) {
    CLOG(INFO, "stdout") << "Error: " << ip.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
