#include "BridgeConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace tb {
namespace {
int parseInt(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    int i = stoi(string(value), &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return i;
  } catch (const std::logic_error&) {
    throw InvalidParameter(string("[") + section + "] " + key +
                           " is not a number: " + value);
  }
}
}  // namespace

string BridgeConfigLoader::defaultConfigPath() {
  return sago::getConfigHome() + "/tabbridge/tabbridge.ini";
}

int BridgeConfigLoader::validatePort(int port) {
  if (port < 1 || port > 65535) {
    throw InvalidParameter("Port must be between 1 and 65535, got " +
                           to_string(port));
  }
  return port;
}

bool BridgeConfigLoader::loadFile(const string& path, BridgeConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Cannot load config file " << path << " (" << rc << ")";
    return false;
  }

  const char* host = ini.GetValue("Networking", "host", NULL);
  if (host) {
    config->host = trim(host);
  }
  const char* port = ini.GetValue("Networking", "port", NULL);
  if (port) {
    config->port = validatePort(parseInt("Networking", "port", port));
  }

  const char* verbose = ini.GetValue("Debug", "verbose", NULL);
  if (verbose) {
    config->verbose = parseInt("Debug", "verbose", verbose);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = parseInt("Debug", "silent", silent) != 0;
  }
  const char* logDirectory = ini.GetValue("Debug", "logdir", NULL);
  if (logDirectory && *logDirectory) {
    config->logDirectory = logDirectory;
  }
  const char* logSize = ini.GetValue("Debug", "logsize", NULL);
  if (logSize && parseInt("Debug", "logsize", logSize) > 0) {
    // make sure maxLogSize is a string of int value
    config->maxLogSize = logSize;
  }
  return true;
}
}  // namespace tb
