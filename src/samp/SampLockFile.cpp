#include "SampLockFile.hpp"

#include "HubConnector.hpp"
#include "SimpleIni.h"

namespace ds9samp {
namespace {
const string FILE_URL_PREFIX = "file://";
}

string locateLockFile() {
  const char* hubEnv = ::getenv(SAMP_HUB_ENV.c_str());
  if (hubEnv != NULL && string(hubEnv).length() > 0) {
    string hub(hubEnv);
    if (hub.rfind(SAMP_LOCKURL_PREFIX, 0) != 0) {
      throw SampException("Unsupported " + SAMP_HUB_ENV + " value: " + hub);
    }
    string url = hub.substr(SAMP_LOCKURL_PREFIX.length());
    if (url.rfind(FILE_URL_PREFIX, 0) != 0) {
      throw SampException("Only file:// lockfile URLs are supported, not " +
                          url);
    }
    // file://localhost/path and file:///path both name /path
    string path = url.substr(FILE_URL_PREFIX.length());
    if (path.rfind("localhost/", 0) == 0) {
      path = path.substr(string("localhost").length());
    }
    replaceAll(path, "%20", " ");
    VLOG(1) << "Using lockfile from " << SAMP_HUB_ENV << ": " << path;
    return path;
  }

#ifdef WIN32
  const char* home = ::getenv("USERPROFILE");
#else
  const char* home = ::getenv("HOME");
#endif
  if (home == NULL) {
    throw SampException(
        "Unable to find the SAMP lockfile as the home directory is not set");
  }
  return string(home) + "/.samp";
}

SampLockInfo readLockFile(const string& path) {
  if (!fs::is_regular_file(path)) {
    throw SampException("Unable to find a running SAMP Hub (no lockfile at " +
                        path + ")");
  }

  // Keys appear before any [section] so SimpleIni files them under ""
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw SampException("Unable to read the SAMP lockfile " + path);
  }

  SampLockInfo info;
  CSimpleIniA::TNamesDepend keys;
  ini.GetAllKeys("", keys);
  for (const auto& key : keys) {
    const char* value = ini.GetValue("", key.pItem, NULL);
    if (value != NULL) {
      info.entries[key.pItem] = value;
    }
  }

  auto secret = info.entries.find("samp.secret");
  auto url = info.entries.find("samp.hub.xmlrpc.url");
  if (secret == info.entries.end() || url == info.entries.end()) {
    throw SampException("The SAMP lockfile " + path +
                        " does not describe a running hub");
  }
  info.secret = secret->second;
  info.xmlrpcUrl = url->second;
  VLOG(1) << "Hub XML-RPC endpoint: " << info.xmlrpcUrl;
  return info;
}
}  // namespace ds9samp
