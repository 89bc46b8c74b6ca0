#include "DriverConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace ds9samp {
namespace {
optional<int> readInt(const CSimpleIniA& ini, const char* section,
                      const char* key, const string& path) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return nullopt;
  }
  try {
    size_t consumed = 0;
    int retval = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return retval;
  } catch (const std::logic_error& le) {
    throw std::runtime_error("Invalid value for [" + string(section) + "] " +
                             key + " in " + path + ": '" + value + "'");
  }
}

optional<string> readString(const CSimpleIniA& ini, const char* section,
                            const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL || string(value).empty()) {
    return nullopt;
  }
  return string(value);
}
}  // namespace

string DriverConfig::defaultPath() {
  return sago::getConfigHome() + "/ds9samp/ds9samp.ini";
}

DriverConfig DriverConfig::load(const string& path, bool required) {
  DriverConfig config;
  if (!fs::exists(path)) {
    if (required) {
      throw std::runtime_error("Config file " + path + " does not exist");
    }
    VLOG(1) << "No config file at " << path;
    return config;
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  config.defaultClient = readString(ini, "Defaults", "name");
  config.defaultTimeout = readInt(ini, "Defaults", "timeout", path);
  if (config.defaultTimeout && (*config.defaultTimeout < 0 ||
                                 *config.defaultTimeout > MAX_TIMEOUT_SECONDS)) {
    throw std::runtime_error("[Defaults] timeout in " + path +
                             " must be between 0 and " +
                             to_string(MAX_TIMEOUT_SECONDS));
  }
  config.verbose = readInt(ini, "Debug", "verbose", path);
  config.logdir = readString(ini, "Debug", "logdir");
  return config;
}

DriverSettings DriverConfig::resolve(const Invocation& invocation) const {
  DriverSettings settings;
  settings.command = invocation.command;
  settings.client = invocation.client ? invocation.client : defaultClient;
  settings.timeout = invocation.timeout
                         ? *invocation.timeout
                         : defaultTimeout.value_or(DEFAULT_TIMEOUT_SECONDS);
  settings.debug = invocation.debug;
  settings.verbose = invocation.verbose ? *invocation.verbose
                                        : verbose.value_or(0);
  settings.logdir = logdir.value_or("");
  return settings;
}
}  // namespace ds9samp
